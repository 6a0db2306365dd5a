#pragma once

#include <juce_core/juce_core.h>
#include <array>
#include <functional>

/** Every stage either execution path can report. */
enum class PipelineStage {
  loading,
  modelLoading,
  pitchDetection,
  noteSegmentation,
  sourceSeparation,
  polyphonicTranscription,
  tempoDetection,
  noteFiltering,
  quantization,
  midiGeneration,
  complete
};

enum class PipelineMode { monophonic, ai };

/** Stage tag as used in progress events, e.g. "pitch_detection". */
juce::String stageName(PipelineStage stage);

/** Human-readable stage title, e.g. "Pitch detection". */
juce::String stageTitle(PipelineStage stage);

/** One progress event. progress covers the whole file, stageProgress the stage. */
struct PipelineProgress {
  PipelineStage stage = PipelineStage::loading;
  double progress = 0.0;
  double stageProgress = 0.0;
  juce::String message;
};

using PipelineProgressCallback = std::function<void(const PipelineProgress &)>;

// ---------------------------------------------------------------------------
// Stage weights for batch progress, in percent of one file.
// ---------------------------------------------------------------------------

constexpr int monophonicStageWeight(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::loading:
    return 5;
  case PipelineStage::pitchDetection:
    return 15;
  case PipelineStage::noteSegmentation:
    return 15;
  case PipelineStage::tempoDetection:
    return 5;
  case PipelineStage::noteFiltering:
    return 5;
  case PipelineStage::quantization:
    return 5;
  case PipelineStage::midiGeneration:
    return 45;
  case PipelineStage::complete:
    return 5;
  case PipelineStage::modelLoading:
  case PipelineStage::sourceSeparation:
  case PipelineStage::polyphonicTranscription:
    return 0;
  }
  return 0;
}

constexpr int aiStageWeight(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::loading:
    return 5;
  case PipelineStage::modelLoading:
    return 15;
  case PipelineStage::sourceSeparation:
    return 25;
  case PipelineStage::polyphonicTranscription:
    return 25;
  case PipelineStage::tempoDetection:
    return 5;
  case PipelineStage::noteFiltering:
    return 5;
  case PipelineStage::quantization:
    return 5;
  case PipelineStage::midiGeneration:
    return 15;
  case PipelineStage::complete:
  case PipelineStage::pitchDetection:
  case PipelineStage::noteSegmentation:
    return 0;
  }
  return 0;
}

constexpr int stageWeight(PipelineMode mode, PipelineStage stage) {
  return mode == PipelineMode::ai ? aiStageWeight(stage)
                                  : monophonicStageWeight(stage);
}

constexpr std::array<PipelineStage, 8> monophonicStageOrder{
    PipelineStage::loading,        PipelineStage::pitchDetection,
    PipelineStage::noteSegmentation, PipelineStage::tempoDetection,
    PipelineStage::noteFiltering,  PipelineStage::quantization,
    PipelineStage::midiGeneration, PipelineStage::complete};

constexpr std::array<PipelineStage, 9> aiStageOrder{
    PipelineStage::loading,          PipelineStage::modelLoading,
    PipelineStage::sourceSeparation, PipelineStage::polyphonicTranscription,
    PipelineStage::tempoDetection,   PipelineStage::noteFiltering,
    PipelineStage::quantization,     PipelineStage::midiGeneration,
    PipelineStage::complete};

template <size_t N>
constexpr int totalWeight(PipelineMode mode,
                          const std::array<PipelineStage, N> &order) {
  int total = 0;
  for (size_t i = 0; i < N; ++i)
    total += stageWeight(mode, order[i]);
  return total;
}

static_assert(totalWeight(PipelineMode::monophonic, monophonicStageOrder) == 100,
              "monophonic stage weights must add up to 100");
static_assert(totalWeight(PipelineMode::ai, aiStageOrder) == 100,
              "AI stage weights must add up to 100");

/** Sum of the weights of the stages that run before this one. */
int weightBefore(PipelineMode mode, PipelineStage stage);

/**
 * Progress across a batch, 0..1. fileIndex is 0-based; stageProgress is the
 * fraction of the current stage already done.
 */
double overallProgress(PipelineMode mode, int fileIndex, int totalFiles,
                       PipelineStage stage, double stageProgress);
