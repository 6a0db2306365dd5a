#pragma once

#include "Audio2MidiErrors.h"
#include "ModelBackends.h"
#include "NoteFilter.h"
#include "PipelineConfig.h"
#include "PipelineProgress.h"
#include "PitchDetector.h"
#include "TempoDetector.h"
#include <memory>
#include <optional>
#include <vector>

/** Outcome of one conversion. Partial successes keep the optional fields empty. */
struct PipelineResult {
  bool success = false;
  juce::File outputFile;
  int noteCount = 0;
  double duration = 0.0; // seconds of MIDI content
  juce::String errorMessage;
  ErrorKind errorKind = ErrorKind::none;
  double processingTime = 0.0; // seconds

  bool separationEnabled = false;
  int stemCount = 1;
  juce::String transcriptionMethod = "monophonic";
  juce::var modelInfo;

  std::optional<double> detectedTempo;
  std::optional<std::vector<double>> beatTimes;
  bool quantizationApplied = false;
  int notesFiltered = 0;
};

/**
 * AudioToMidiPipeline
 *
 * Runs one audio buffer through either the monophonic path (pitch tracking,
 * segmentation) or the AI path (optional source separation, per-stem
 * polyphonic transcription), then tempo detection, filtering, quantization
 * and MIDI generation.
 *
 * Runs synchronously on the calling thread. Models are resolved on first use
 * and kept for the lifetime of the instance, so one instance must not be
 * shared between threads.
 */
class AudioToMidiPipeline {
public:
  explicit AudioToMidiPipeline(
      PipelineConfig config = {}, PipelineProgressCallback progressCallback = nullptr,
      ModelBackendFactory backendFactory = ModelBackendFactory::withoutBundledModels(),
      std::shared_ptr<ModelCache> modelCache = nullptr);

  /**
   * Converts audio and writes the MIDI file. With no outputFile the source
   * file's name with a .mid extension is used. Never throws; failures are
   * reported on the result.
   */
  PipelineResult process(const AudioData &audio, const juce::File &outputFile = {});

  const PipelineConfig &getConfig() const { return config; }

  void setProgressCallback(PipelineProgressCallback callback) {
    progressCallback = std::move(callback);
  }

  bool modelsLoaded() const;

  /** Accelerator description from the loaded models, or the host CPU. */
  DeviceInfo getDeviceInfo() const;

private:
  juce::Result processMonophonic(const AudioData &audio, const juce::File &outputFile,
                                 PipelineResult &result);
  juce::Result processWithAi(const AudioData &audio, const juce::File &outputFile,
                             PipelineResult &result);

  void initialiseModels();

  /** Detected tempo on success; also fills the tempo fields of result. */
  std::optional<TempoInfo> detectTempo(const AudioData &audio, double progressValue,
                                       PipelineResult &result);

  std::vector<NoteEvent> filterNotes(const std::vector<NoteEvent> &notes,
                                     const juce::String &label, int &removed);

  std::vector<NoteEvent> quantizeNotes(const std::vector<NoteEvent> &notes,
                                       double tempoBpm, const juce::String &label,
                                       bool &applied);

  void logMemoryAdvisory(const DeviceDiagnostics *diagnostics, int numChannels,
                         int numSamples, double sampleRate,
                         const juce::String &task) const;

  juce::File resolveOutputFile(const AudioData &audio, const juce::File &requested) const;

  void reportProgress(PipelineStage stage, double progress, double stageProgress,
                      const juce::String &message);

  ModelProgressCallback stageCallback(PipelineStage stage, double base, double span,
                                      const juce::String &prefix, double cap = 1.0);

  juce::var buildModelInfo(const DeviceInfo &deviceInfo) const;

  PipelineConfig config;
  PipelineProgressCallback progressCallback;
  ModelBackendFactory backendFactory;
  std::shared_ptr<ModelCache> modelCache;

  PitchDetector pitchDetector;
  TempoDetector tempoDetector;
  NoteFilter noteFilter;
  HostDeviceDiagnostics hostDiagnostics;

  std::shared_ptr<SourceSeparator> separator;
  std::shared_ptr<PolyphonicTranscriber> transcriber;

  double lastProgress = 0.0;

  static constexpr const char *transcriptionModelName = "basic_pitch";
};
