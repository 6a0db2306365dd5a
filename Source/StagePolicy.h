#pragma once

#include "Audio2MidiErrors.h"
#include "NoteTypes.h"
#include "PipelineProgress.h"
#include <optional>
#include <utility>
#include <vector>

/** What the orchestrator does when a stage fails or comes back empty. */
enum class FallbackAction {
  abortPipeline,     // the run fails with the stage's message
  keepPreviousValue, // log a warning, carry on with the stage's input
  skipStage,         // log a warning, carry on without the stage's output
  acceptResult       // not a failure at all
};

struct StagePolicy {
  FallbackAction onError;
  FallbackAction onEmptyResult;
};

/** The fallback matrix of the conversion pipeline. */
constexpr StagePolicy policyFor(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::loading:
  case PipelineStage::modelLoading:
  case PipelineStage::pitchDetection:
  case PipelineStage::noteSegmentation:
  case PipelineStage::sourceSeparation:
  case PipelineStage::midiGeneration:
    return {FallbackAction::abortPipeline, FallbackAction::abortPipeline};
  case PipelineStage::polyphonicTranscription:
    return {FallbackAction::abortPipeline, FallbackAction::acceptResult};
  case PipelineStage::tempoDetection:
    return {FallbackAction::skipStage, FallbackAction::skipStage};
  case PipelineStage::noteFiltering:
  case PipelineStage::quantization:
    return {FallbackAction::keepPreviousValue, FallbackAction::keepPreviousValue};
  case PipelineStage::complete:
    return {FallbackAction::acceptResult, FallbackAction::acceptResult};
  }
  return {FallbackAction::abortPipeline, FallbackAction::abortPipeline};
}

/** Message used when a stage produces nothing. */
juce::String emptyResultMessage(PipelineStage stage);

/**
 * Result of one stage after the policy has been applied.
 *
 * status is failed whenever the stage itself failed; fellBack tells whether
 * the failure was absorbed by keeping the previous value or skipping.
 */
template <typename T> struct StageOutcome {
  T value{};
  juce::Result status = juce::Result::ok();
  ErrorKind errorKind = ErrorKind::none;
  bool fellBack = false;

  bool aborted() const { return status.failed() && !fellBack; }
};

using NoteStageOutcome = StageOutcome<std::vector<NoteEvent>>;

namespace StageDetail {

template <typename T> bool isEmptyResult(const std::vector<T> &v) {
  return v.empty();
}

template <typename T> bool isEmptyResult(const std::optional<T> &v) {
  return !v.has_value();
}

template <typename T>
StageOutcome<T> applyFallback(PipelineStage stage, FallbackAction action,
                              const T &previous, T produced,
                              const juce::String &reason, ErrorKind kind) {
  StageOutcome<T> outcome;
  outcome.errorKind = kind;

  switch (action) {
  case FallbackAction::acceptResult:
    outcome.value = std::move(produced);
    return outcome;

  case FallbackAction::abortPipeline:
    outcome.status = juce::Result::fail(stageTitle(stage) + " failed: " + reason);
    return outcome;

  case FallbackAction::keepPreviousValue:
    juce::Logger::writeToLog("Warning: " + stageTitle(stage) + " failed: " +
                             reason + ", keeping previous result");
    outcome.value = previous;
    break;

  case FallbackAction::skipStage:
    juce::Logger::writeToLog("Warning: " + stageTitle(stage) + " failed: " +
                             reason + ", skipping stage");
    break;
  }

  outcome.status = juce::Result::fail(reason);
  outcome.fellBack = true;
  return outcome;
}

} // namespace StageDetail

/**
 * Runs one stage and turns whatever it throws or returns into data according
 * to policyFor(stage). previous is what the pipeline keeps on fallback.
 */
template <typename T, typename StageFn>
StageOutcome<T> runStage(PipelineStage stage, const T &previous, StageFn &&fn) {
  const auto policy = policyFor(stage);

  T produced{};
  try {
    produced = fn();
  } catch (const std::exception &e) {
    return StageDetail::applyFallback(stage, policy.onError, previous, T{},
                                      juce::String(e.what()), classifyError(e));
  }

  if (StageDetail::isEmptyResult(produced)) {
    auto action = policy.onEmptyResult;
    // Falling back to an empty input changes nothing, so just accept.
    if (action == FallbackAction::keepPreviousValue &&
        StageDetail::isEmptyResult(previous))
      action = FallbackAction::acceptResult;

    return StageDetail::applyFallback(stage, action, previous, std::move(produced),
                                      emptyResultMessage(stage),
                                      action == FallbackAction::abortPipeline
                                          ? ErrorKind::invalidInput
                                          : ErrorKind::none);
  }

  StageOutcome<T> outcome;
  outcome.value = std::move(produced);
  return outcome;
}
