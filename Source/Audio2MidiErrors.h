#pragma once

#include <juce_core/juce_core.h>
#include <stdexcept>

/** Empty or malformed audio, or a configuration that cannot be used. */
class InvalidInputError : public std::runtime_error {
public:
  explicit InvalidInputError(const juce::String &message)
      : std::runtime_error(message.toStdString()) {}
};

/** Beat tracking produced nothing usable. */
class TempoDetectionError : public std::runtime_error {
public:
  explicit TempoDetectionError(const juce::String &message)
      : std::runtime_error(message.toStdString()) {}
};

/** An audio file could not be decoded. */
class AudioLoadError : public std::runtime_error {
public:
  AudioLoadError(const juce::File &f, const juce::String &message)
      : std::runtime_error(("Failed to load " + f.getFullPathName() + ": " +
                            message)
                               .toStdString()),
        file(f) {}

  const juce::File &getFile() const noexcept { return file; }

private:
  juce::File file;
};

/** The note data handed to the MIDI generator breaks its contract. */
class MidiGenerationError : public std::runtime_error {
public:
  enum class Reason {
    noNotes,
    negativeTime,
    invalidDuration,
    invalidPitch,
    invalidVelocity,
    noStems,
    invalidStemName,
    duplicateStem,
    invalidTempo,
    writeFailed
  };

  MidiGenerationError(Reason r, const juce::String &message)
      : std::runtime_error(message.toStdString()), reason(r) {}

  Reason getReason() const noexcept { return reason; }

private:
  Reason reason;
};

/**
 * Base class for failures of the separation and transcription models.
 *
 * what() reads "model: message (details)".
 */
class ModelError : public std::runtime_error {
public:
  ModelError(const juce::String &model, const juce::String &msg,
             const juce::String &extraDetails = {})
      : std::runtime_error(format(model, msg, extraDetails).toStdString()),
        modelName(model), message(msg), details(extraDetails) {}

  const juce::String &getModelName() const noexcept { return modelName; }
  const juce::String &getMessage() const noexcept { return message; }
  const juce::String &getDetails() const noexcept { return details; }

private:
  static juce::String format(const juce::String &model,
                             const juce::String &msg,
                             const juce::String &extraDetails) {
    auto base = model + ": " + msg;
    return extraDetails.isNotEmpty() ? base + " (" + extraDetails + ")" : base;
  }

  juce::String modelName, message, details;
};

/** Weights could not be fetched into the local cache. */
class ModelDownloadError : public ModelError {
public:
  using ModelError::ModelError;
};

/** Cached weights could not be loaded onto the device. */
class ModelLoadError : public ModelError {
public:
  using ModelError::ModelError;
};

/** A forward pass failed. */
class InferenceError : public ModelError {
public:
  using ModelError::ModelError;
};

/** The requested accelerator is missing or unusable. */
class UnsupportedDeviceError : public ModelError {
public:
  using ModelError::ModelError;
};

/** Broad category of a failed conversion, recorded on the result. */
enum class ErrorKind {
  none,
  invalidInput,
  audioLoad,
  generation,
  modelDownload,
  modelLoad,
  inference,
  unsupportedDevice,
  internal
};

inline ErrorKind classifyError(const std::exception &e) {
  if (dynamic_cast<const InvalidInputError *>(&e) != nullptr)
    return ErrorKind::invalidInput;
  if (dynamic_cast<const AudioLoadError *>(&e) != nullptr)
    return ErrorKind::audioLoad;
  if (dynamic_cast<const MidiGenerationError *>(&e) != nullptr)
    return ErrorKind::generation;
  if (dynamic_cast<const ModelDownloadError *>(&e) != nullptr)
    return ErrorKind::modelDownload;
  if (dynamic_cast<const ModelLoadError *>(&e) != nullptr)
    return ErrorKind::modelLoad;
  if (dynamic_cast<const InferenceError *>(&e) != nullptr)
    return ErrorKind::inference;
  if (dynamic_cast<const UnsupportedDeviceError *>(&e) != nullptr)
    return ErrorKind::unsupportedDevice;
  return ErrorKind::internal;
}

/** Short advice shown next to a failed file; empty when there is none. */
inline juce::String remediationHint(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::modelDownload:
    return "Check your internet connection and try again.";
  case ErrorKind::modelLoad:
    return "The model cache may be corrupted. Try clearing the models directory.";
  case ErrorKind::inference:
    return "The model ran out of resources. Try a shorter file or disable AI "
           "features.";
  case ErrorKind::unsupportedDevice:
    return "Run on the CPU or install a supported accelerator driver.";
  case ErrorKind::audioLoad:
    return "Make sure the file is a readable WAV, AIFF, FLAC, Ogg or MP3 file.";
  case ErrorKind::none:
  case ErrorKind::invalidInput:
  case ErrorKind::generation:
  case ErrorKind::internal:
    break;
  }
  return {};
}
