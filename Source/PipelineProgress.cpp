#include "PipelineProgress.h"

juce::String stageName(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::loading:
    return "loading";
  case PipelineStage::modelLoading:
    return "model_loading";
  case PipelineStage::pitchDetection:
    return "pitch_detection";
  case PipelineStage::noteSegmentation:
    return "note_segmentation";
  case PipelineStage::sourceSeparation:
    return "source_separation";
  case PipelineStage::polyphonicTranscription:
    return "polyphonic_transcription";
  case PipelineStage::tempoDetection:
    return "tempo_detection";
  case PipelineStage::noteFiltering:
    return "note_filtering";
  case PipelineStage::quantization:
    return "quantization";
  case PipelineStage::midiGeneration:
    return "midi_generation";
  case PipelineStage::complete:
    return "complete";
  }
  return "unknown";
}

juce::String stageTitle(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::loading:
    return "Loading";
  case PipelineStage::modelLoading:
    return "Model loading";
  case PipelineStage::pitchDetection:
    return "Pitch detection";
  case PipelineStage::noteSegmentation:
    return "Note segmentation";
  case PipelineStage::sourceSeparation:
    return "Source separation";
  case PipelineStage::polyphonicTranscription:
    return "Polyphonic transcription";
  case PipelineStage::tempoDetection:
    return "Tempo detection";
  case PipelineStage::noteFiltering:
    return "Note filtering";
  case PipelineStage::quantization:
    return "Quantization";
  case PipelineStage::midiGeneration:
    return "MIDI generation";
  case PipelineStage::complete:
    return "Complete";
  }
  return "Unknown";
}

int weightBefore(PipelineMode mode, PipelineStage stage) {
  int total = 0;
  auto accumulate = [&](const auto &order) {
    for (auto s : order) {
      if (s == stage)
        return;
      total += stageWeight(mode, s);
    }
  };

  if (mode == PipelineMode::ai)
    accumulate(aiStageOrder);
  else
    accumulate(monophonicStageOrder);

  return total;
}

double overallProgress(PipelineMode mode, int fileIndex, int totalFiles,
                       PipelineStage stage, double stageProgress) {
  if (totalFiles <= 0)
    return 0.0;

  const double withinStage =
      stageWeight(mode, stage) * juce::jlimit(0.0, 1.0, stageProgress);
  const double fileFraction = (weightBefore(mode, stage) + withinStage) / 100.0;

  return juce::jlimit(0.0, 1.0,
                      ((double)fileIndex + juce::jmin(1.0, fileFraction)) /
                          (double)totalFiles);
}
