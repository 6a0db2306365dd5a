#include "StagePolicy.h"

juce::String emptyResultMessage(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::pitchDetection:
    return "No pitch detected in audio";
  case PipelineStage::noteSegmentation:
    return "No notes detected in audio";
  case PipelineStage::sourceSeparation:
    return "Source separation returned no stems";
  case PipelineStage::polyphonicTranscription:
    return "No notes transcribed";
  case PipelineStage::noteFiltering:
    return "Note filtering removed all notes";
  case PipelineStage::quantization:
    return "Quantization removed all notes";
  case PipelineStage::tempoDetection:
    return "No tempo detected";
  case PipelineStage::midiGeneration:
    return "No MIDI produced";
  case PipelineStage::loading:
  case PipelineStage::modelLoading:
  case PipelineStage::complete:
    break;
  }
  return "Stage produced no output";
}
