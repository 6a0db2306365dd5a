#pragma once

#include "Audio2MidiErrors.h"
#include "NoteTypes.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

/** Progress from a model collaborator: fraction 0..1 plus a status line. */
using ModelProgressCallback =
    std::function<void(double progress, const juce::String &message)>;

/** What the inference device looks like, for logging and result metadata. */
struct DeviceInfo {
  juce::String deviceType = "cpu";
  juce::String deviceName = "CPU";
  bool acceleratorAvailable = false;
  std::optional<double> memoryGb; // accelerator memory, when there is one

  juce::var toVar() const;
};

/**
 * Optional capability of a model collaborator. Only ever used for advisory
 * log lines, never for correctness.
 */
class DeviceDiagnostics {
public:
  virtual ~DeviceDiagnostics() = default;

  virtual DeviceInfo getDeviceInfo() const = 0;

  /** Rough peak working set for a block of audio, in MB. */
  virtual double estimateMemoryRequirementMb(int numChannels, int numSamples,
                                             double sampleRate) const = 0;
};

/** Host CPU, no accelerator memory to report. */
class HostDeviceDiagnostics : public DeviceDiagnostics {
public:
  explicit HostDeviceDiagnostics(double workingSetFactor = 24.0);

  DeviceInfo getDeviceInfo() const override;
  double estimateMemoryRequirementMb(int numChannels, int numSamples,
                                     double sampleRate) const override;

private:
  double factor;
};

/** Splits a mix into named stems (vocals, drums, bass, other, ...). */
class SourceSeparator {
public:
  virtual ~SourceSeparator() = default;

  virtual juce::String getModelName() const = 0;

  /** Loads weights once; later calls only report completion. */
  virtual void ensureLoaded(const ModelProgressCallback &progress) = 0;

  virtual std::vector<SeparatedStem> separate(const AudioData &audio,
                                              const ModelProgressCallback &progress) = 0;

  virtual const DeviceDiagnostics *getDiagnostics() const { return nullptr; }
};

/** Note reported by a transcription model, pitch as a MIDI number. */
struct TranscribedNote {
  double startTime = 0.0;
  double endTime = 0.0;
  int pitch = 60;
  double amplitude = 0.0; // 0..1
};

/** Thresholds handed to the polyphonic transcription model. */
struct TranscriptionSettings {
  double onsetThreshold = 0.5;
  double frameThreshold = 0.3;
  double minimumNoteLength = 0.058; // seconds
  std::optional<double> minimumFrequency;
  std::optional<double> maximumFrequency;
  juce::String modelPath;

  /** "balanced", "sensitive" or "conservative"; anything else is balanced. */
  static TranscriptionSettings fromPreset(const juce::String &presetName);
  static juce::StringArray getPresetNames();

  juce::var toVar() const;
};

class PolyphonicTranscriber {
public:
  virtual ~PolyphonicTranscriber() = default;

  virtual juce::String getModelName() const = 0;

  virtual void ensureLoaded(const ModelProgressCallback &progress) = 0;

  virtual std::vector<TranscribedNote>
  transcribeStem(const SeparatedStem &stem, const ModelProgressCallback &progress) = 0;

  virtual const DeviceDiagnostics *getDiagnostics() const { return nullptr; }
};

/**
 * Maps model notes to NoteEvents: velocity is 40 + 70 * amplitude clamped to
 * 40..110, confidence is the amplitude.
 */
std::vector<NoteEvent>
convertTranscribedNotes(const std::vector<TranscribedNote> &notes);

/** True when an error text describes an accelerator running out of memory. */
bool isOutOfMemoryMessage(const juce::String &text);

//==============================================================================
/**
 * A model collaborator resolved once: either a usable instance or the reason
 * it cannot be used.
 */
template <typename Model> class ModelBackend {
public:
  struct Available {
    std::shared_ptr<Model> model;
  };

  struct Unavailable {
    juce::String modelName;
    juce::String reason;
    juce::String details;
  };

  static ModelBackend available(std::shared_ptr<Model> model) {
    jassert(model != nullptr);
    return ModelBackend(Available{std::move(model)});
  }

  static ModelBackend unavailable(const juce::String &modelName,
                                  const juce::String &reason,
                                  const juce::String &details = {}) {
    return ModelBackend(Unavailable{modelName, reason, details});
  }

  bool isAvailable() const { return std::holds_alternative<Available>(state); }

  template <typename Visitor> decltype(auto) visit(Visitor &&visitor) const {
    return std::visit(std::forward<Visitor>(visitor), state);
  }

  /** The model, or ModelLoadError carrying the unavailability reason. */
  std::shared_ptr<Model> require() const {
    if (const auto *a = std::get_if<Available>(&state))
      return a->model;

    const auto &u = std::get<Unavailable>(state);
    throw ModelLoadError(u.modelName, u.reason, u.details);
  }

private:
  explicit ModelBackend(std::variant<Available, Unavailable> s)
      : state(std::move(s)) {}

  std::variant<Available, Unavailable> state;
};

/** Builds backends for the models this binary knows about. */
struct ModelBackendFactory {
  std::function<ModelBackend<SourceSeparator>(const juce::String &modelName,
                                              const juce::String &device,
                                              const juce::File &cacheDir)>
      createSeparator;

  std::function<ModelBackend<PolyphonicTranscriber>(
      const TranscriptionSettings &settings, const juce::String &device,
      const juce::File &cacheDir)>
      createTranscriber;

  /** The factory of a build without bundled models: every request fails. */
  static ModelBackendFactory withoutBundledModels();
};

//==============================================================================
/**
 * Resolved backends keyed by (model name, device). Owned by whoever creates
 * the pipelines; not thread-safe.
 */
class ModelCache {
public:
  using Key = std::pair<juce::String, juce::String>;

  template <typename Factory>
  ModelBackend<SourceSeparator> getSeparator(const juce::String &modelName,
                                             const juce::String &device,
                                             Factory &&create) {
    return getOrCreate(separators, {modelName, device},
                       std::forward<Factory>(create));
  }

  template <typename Factory>
  ModelBackend<PolyphonicTranscriber>
  getTranscriber(const juce::String &modelName, const juce::String &device,
                 Factory &&create) {
    return getOrCreate(transcribers, {modelName, device},
                       std::forward<Factory>(create));
  }

  bool contains(const juce::String &modelName, const juce::String &device) const;
  int size() const { return (int)(separators.size() + transcribers.size()); }
  void clear();

private:
  template <typename Model, typename Factory>
  static ModelBackend<Model>
  getOrCreate(std::map<Key, ModelBackend<Model>> &entries, const Key &key,
              Factory &&create) {
    auto it = entries.find(key);
    if (it == entries.end())
      it = entries.emplace(key, create()).first;
    return it->second;
  }

  std::map<Key, ModelBackend<SourceSeparator>> separators;
  std::map<Key, ModelBackend<PolyphonicTranscriber>> transcribers;
};
