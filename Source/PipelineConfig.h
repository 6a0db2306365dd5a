#pragma once

#include "ModelBackends.h"
#include "NoteFilter.h"
#include "NoteQuantizer.h"
#include <juce_core/juce_core.h>

/**
 * PipelineConfig
 *
 * Every knob of a conversion run. Serialises to and from JSON with
 * snake_case keys; keys that are not recognised are ignored.
 */
struct PipelineConfig {
  // Pitch range as note names ("C2") or plain Hz ("65.4").
  juce::String fmin = "C2";
  juce::String fmax = "C7";
  int hopLength = 512;
  int frameLength = 2048;

  double tempo = 120.0; // used when tempo detection is off or fails
  double minNoteDuration = 0.05;
  bool detectTempo = true;

  bool quantizationEnabled = false;
  QuantizationGrid quantizationGrid = QuantizationGrid::sixteenth;

  FilterConfig filter;

  bool useAiModels = false;
  bool enableSeparation = false;
  juce::String separationModel = "htdemucs";
  juce::String device = "auto";
  juce::File modelsCacheDir;
  juce::String sensitivityPreset = "balanced";
  TranscriptionSettings transcription;

  juce::File outputDirectory;

  /** Pitch range in Hz; throws InvalidInputError for unparseable values. */
  double getFminHz() const;
  double getFmaxHz() const;

  /** Checks ranges and cross-field constraints. */
  juce::Result validate() const;

  juce::var toVar() const;

  /**
   * Reads a JSON object on top of the defaults. Throws InvalidInputError
   * ("bad configuration: ...") on wrong types or values that fail validate().
   */
  static PipelineConfig fromVar(const juce::var &json);

  static PipelineConfig loadFromFile(const juce::File &file);
  juce::Result saveToFile(const juce::File &file) const;
};
