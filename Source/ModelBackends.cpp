#include "ModelBackends.h"

juce::var DeviceInfo::toVar() const {
  auto *obj = new juce::DynamicObject();
  obj->setProperty("device_type", deviceType);
  obj->setProperty("device_name", deviceName);
  obj->setProperty("accelerator_available", acceleratorAvailable);
  obj->setProperty("memory_gb", memoryGb.has_value() ? juce::var(*memoryGb)
                                                     : juce::var());
  return juce::var(obj);
}

// ---------------------------------------------------------------------------
// HostDeviceDiagnostics
// ---------------------------------------------------------------------------

HostDeviceDiagnostics::HostDeviceDiagnostics(double workingSetFactor)
    : factor(workingSetFactor) {}

DeviceInfo HostDeviceDiagnostics::getDeviceInfo() const {
  DeviceInfo info;
  info.deviceType = "cpu";
  const auto model = juce::SystemStats::getCpuModel();
  info.deviceName = model.isNotEmpty() ? model : juce::String("CPU");
  info.acceleratorAvailable = false;
  return info;
}

double HostDeviceDiagnostics::estimateMemoryRequirementMb(int numChannels,
                                                          int numSamples,
                                                          double sampleRate) const {
  juce::ignoreUnused(sampleRate);
  const double bytes =
      (double)juce::jmax(1, numChannels) * juce::jmax(0, numSamples) * sizeof(float);
  return bytes * factor / (1024.0 * 1024.0);
}

// ---------------------------------------------------------------------------
// Transcription
// ---------------------------------------------------------------------------

TranscriptionSettings TranscriptionSettings::fromPreset(const juce::String &presetName) {
  TranscriptionSettings settings;
  const auto name = presetName.trim().toLowerCase();

  if (name == "sensitive") {
    settings.onsetThreshold = 0.3;
    settings.frameThreshold = 0.2;
    settings.minimumNoteLength = 0.05;
  } else if (name == "conservative") {
    settings.onsetThreshold = 0.7;
    settings.frameThreshold = 0.4;
    settings.minimumNoteLength = 0.1;
  } else if (name.isNotEmpty() && name != "balanced") {
    juce::Logger::writeToLog("Warning: unknown transcription preset '" +
                             presetName + "', using balanced");
  }

  return settings;
}

juce::StringArray TranscriptionSettings::getPresetNames() {
  return {"balanced", "sensitive", "conservative"};
}

juce::var TranscriptionSettings::toVar() const {
  auto *obj = new juce::DynamicObject();
  obj->setProperty("onset_threshold", onsetThreshold);
  obj->setProperty("frame_threshold", frameThreshold);
  obj->setProperty("minimum_note_length", minimumNoteLength);
  obj->setProperty("minimum_frequency", minimumFrequency.has_value()
                                            ? juce::var(*minimumFrequency)
                                            : juce::var());
  obj->setProperty("maximum_frequency", maximumFrequency.has_value()
                                            ? juce::var(*maximumFrequency)
                                            : juce::var());
  if (modelPath.isNotEmpty())
    obj->setProperty("model_path", modelPath);
  return juce::var(obj);
}

std::vector<NoteEvent>
convertTranscribedNotes(const std::vector<TranscribedNote> &notes) {
  constexpr int velocityMin = 40;
  constexpr int velocityMax = 110;

  std::vector<NoteEvent> converted;
  converted.reserve(notes.size());

  for (const auto &n : notes) {
    NoteEvent e;
    e.startTime = n.startTime;
    e.endTime = n.endTime;
    e.midiNote = NoteUtils::clampMidiNote(n.pitch);
    e.pitchHz = NoteUtils::midiToHz((double)e.midiNote);
    e.velocity = juce::jlimit(
        velocityMin, velocityMax,
        (int)(velocityMin + (velocityMax - velocityMin) * n.amplitude));
    e.confidence = juce::jlimit(0.0, 1.0, n.amplitude);
    converted.push_back(e);
  }
  return converted;
}

bool isOutOfMemoryMessage(const juce::String &text) {
  return text.containsIgnoreCase("out of memory");
}

// ---------------------------------------------------------------------------
// Factory and cache
// ---------------------------------------------------------------------------

ModelBackendFactory ModelBackendFactory::withoutBundledModels() {
  ModelBackendFactory factory;

  factory.createSeparator = [](const juce::String &modelName,
                               const juce::String &, const juce::File &) {
    return ModelBackend<SourceSeparator>::unavailable(
        modelName, "Source separation is not available in this build.",
        "Rebuild with a separation backend to enable stem splitting.");
  };

  factory.createTranscriber = [](const TranscriptionSettings &,
                                 const juce::String &, const juce::File &) {
    return ModelBackend<PolyphonicTranscriber>::unavailable(
        "basic_pitch", "Polyphonic transcription is not available in this build.",
        "Rebuild with a transcription backend or run without AI models.");
  };

  return factory;
}

bool ModelCache::contains(const juce::String &modelName,
                          const juce::String &device) const {
  const Key key{modelName, device};
  return separators.count(key) > 0 || transcribers.count(key) > 0;
}

void ModelCache::clear() {
  separators.clear();
  transcribers.clear();
}
