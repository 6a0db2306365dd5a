#include "AudioToMidiPipeline.h"
#include "MidiGenerator.h"
#include "NoteQuantizer.h"
#include "StagePolicy.h"
#include <utility>

namespace {

PipelineConfig validated(PipelineConfig config) {
  const auto check = config.validate();
  if (check.failed())
    throw InvalidInputError("bad configuration: " + check.getErrorMessage());
  return config;
}

// "8.00 GB", or "unknown" when the device does not report its memory.
juce::String formatGb(const DeviceInfo &info) {
  if (!info.memoryGb.has_value())
    return "unknown";
  return juce::String(*info.memoryGb, 2) + " GB";
}

juce::Result abortWith(PipelineResult &result, const juce::String &message,
                       ErrorKind kind) {
  result.errorKind = kind;
  return juce::Result::fail(message);
}

template <typename T>
juce::Result abortWith(PipelineResult &result, const StageOutcome<T> &outcome) {
  return abortWith(result, outcome.status.getErrorMessage(), outcome.errorKind);
}

// Part of a file's progress covered by the model-driven stages of the AI path.
std::pair<double, double> aiStageRange(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::modelLoading:
    return {0.05, 0.5};
  case PipelineStage::sourceSeparation:
    return {0.5, 0.7};
  case PipelineStage::polyphonicTranscription:
    return {0.7, 0.9};
  default:
    return {0.0, 1.0};
  }
}

} // namespace

AudioToMidiPipeline::AudioToMidiPipeline(PipelineConfig c,
                                         PipelineProgressCallback callback,
                                         ModelBackendFactory factory,
                                         std::shared_ptr<ModelCache> cache)
    : config(validated(std::move(c))), progressCallback(std::move(callback)),
      backendFactory(std::move(factory)),
      modelCache(cache != nullptr ? std::move(cache) : std::make_shared<ModelCache>()),
      pitchDetector(config.getFminHz(), config.getFmaxHz(), config.hopLength,
                    config.frameLength),
      tempoDetector(true, 120.0, config.hopLength), noteFilter(config.filter) {}

bool AudioToMidiPipeline::modelsLoaded() const {
  return transcriber != nullptr &&
         (!config.enableSeparation || separator != nullptr);
}

DeviceInfo AudioToMidiPipeline::getDeviceInfo() const {
  if (separator != nullptr && separator->getDiagnostics() != nullptr)
    return separator->getDiagnostics()->getDeviceInfo();
  if (transcriber != nullptr && transcriber->getDiagnostics() != nullptr)
    return transcriber->getDiagnostics()->getDeviceInfo();
  return hostDiagnostics.getDeviceInfo();
}

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------

PipelineResult AudioToMidiPipeline::process(const AudioData &audio,
                                            const juce::File &outputFile) {
  const double startMs = juce::Time::getMillisecondCounterHiRes();
  PipelineResult result;
  lastProgress = 0.0;

  try {
    reportProgress(PipelineStage::loading, 0.0, 0.0, "Loading audio...");

    const auto status = config.useAiModels
                            ? processWithAi(audio, outputFile, result)
                            : processMonophonic(audio, outputFile, result);

    if (status.failed()) {
      result.success = false;
      result.errorMessage = status.getErrorMessage();
    }
  } catch (const std::exception &e) {
    result.success = false;
    result.errorMessage = e.what();
    result.errorKind = classifyError(e);
  }

  result.processingTime = (juce::Time::getMillisecondCounterHiRes() - startMs) / 1000.0;

  if (result.success) {
    juce::Logger::writeToLog("Successfully converted audio to MIDI: " +
                             juce::String(result.noteCount) + " notes, " +
                             juce::String(result.duration, 2) + "s duration, took " +
                             juce::String(result.processingTime, 2) + "s");
  } else {
    result.noteCount = 0;
    juce::Logger::writeToLog("Error: Audio-to-MIDI conversion failed: " +
                             result.errorMessage);
  }

  return result;
}

// ---------------------------------------------------------------------------
// Monophonic path
// ---------------------------------------------------------------------------

juce::Result AudioToMidiPipeline::processMonophonic(const AudioData &audio,
                                                    const juce::File &outputFile,
                                                    PipelineResult &result) {
  reportProgress(PipelineStage::pitchDetection, 0.1, 0.0, "Detecting pitch...");
  auto pitch = runStage(PipelineStage::pitchDetection, std::vector<PitchFrame>{},
                        [&] { return pitchDetector.detectPitch(audio); });
  if (pitch.aborted())
    return abortWith(result, pitch);
  reportProgress(PipelineStage::pitchDetection, 0.33, 1.0, "Pitch detection complete");

  reportProgress(PipelineStage::noteSegmentation, 0.4, 0.0, "Segmenting notes...");
  auto segmented = runStage(PipelineStage::noteSegmentation, std::vector<NoteEvent>{}, [&] {
    return pitchDetector.segmentNotes(pitch.value, audio, config.minNoteDuration);
  });
  if (segmented.aborted())
    return abortWith(result, segmented);
  reportProgress(PipelineStage::noteSegmentation, 0.5, 1.0, "Note segmentation complete");

  auto notes = std::move(segmented.value);

  double tempoBpm = config.tempo;
  if (config.detectTempo) {
    if (auto info = detectTempo(audio, 0.55, result))
      tempoBpm = info->tempoBpm;
    reportProgress(PipelineStage::tempoDetection, 0.6, 1.0, "Tempo detection complete");
  }

  reportProgress(PipelineStage::noteFiltering, 0.65, 0.0, "Filtering notes...");
  notes = filterNotes(notes, "notes", result.notesFiltered);
  reportProgress(PipelineStage::noteFiltering, 0.7, 1.0, "Note filtering complete");

  if (config.quantizationEnabled) {
    reportProgress(PipelineStage::quantization, 0.75, 0.0, "Quantizing notes...");
    notes = quantizeNotes(notes, tempoBpm, "notes", result.quantizationApplied);
    reportProgress(PipelineStage::quantization, 0.8, 1.0, "Note quantization complete");
  }

  reportProgress(PipelineStage::midiGeneration, 0.85, 0.0, "Generating MIDI...");
  juce::File target;
  auto midi = runStage(PipelineStage::midiGeneration, std::optional<MidiInfo>{}, [&] {
    target = resolveOutputFile(audio, outputFile);
    MidiGenerator generator(tempoBpm);
    generator.createMidi(notes).writeTo(target);
    return std::optional<MidiInfo>(MidiGenerator::getMidiInfo(notes));
  });
  if (midi.aborted())
    return abortWith(result, midi);
  reportProgress(PipelineStage::midiGeneration, 0.95, 1.0, "MIDI generation complete");

  result.success = true;
  result.outputFile = target;
  result.noteCount = midi.value->noteCount;
  result.duration = midi.value->duration;
  result.transcriptionMethod = "monophonic";
  result.separationEnabled = false;
  result.stemCount = 1;

  reportProgress(PipelineStage::complete, 1.0, 1.0, "Conversion complete");
  return juce::Result::ok();
}

// ---------------------------------------------------------------------------
// AI path
// ---------------------------------------------------------------------------

void AudioToMidiPipeline::initialiseModels() {
  if (modelsLoaded())
    return;

  reportProgress(PipelineStage::modelLoading, 0.05, 0.0, "Preparing AI models...");

  if (config.enableSeparation && separator == nullptr) {
    separator = modelCache
                    ->getSeparator(config.separationModel, config.device,
                                   [this] {
                                     return backendFactory.createSeparator(
                                         config.separationModel, config.device,
                                         config.modelsCacheDir);
                                   })
                    .require();
  }

  if (transcriber == nullptr) {
    transcriber = modelCache
                      ->getTranscriber(transcriptionModelName, config.device,
                                       [this] {
                                         return backendFactory.createTranscriber(
                                             config.transcription, config.device,
                                             config.modelsCacheDir);
                                       })
                      .require();
  }

  const auto info = getDeviceInfo();
  juce::Logger::writeToLog("Device: " + info.deviceType + " (" + info.deviceName + ")");
  if (info.acceleratorAvailable && info.memoryGb.has_value())
    juce::Logger::writeToLog("GPU memory: " + formatGb(info) + " available");
}

juce::Result AudioToMidiPipeline::processWithAi(const AudioData &audio,
                                                const juce::File &outputFile,
                                                PipelineResult &result) {
  if (audio.isEmpty())
    return abortWith(result, "Audio data is empty", ErrorKind::invalidInput);

  reportProgress(PipelineStage::modelLoading, 0.05, 0.0, "Initializing AI models...");

  try {
    initialiseModels();

    if (separator != nullptr && config.enableSeparation)
      separator->ensureLoaded(stageCallback(PipelineStage::modelLoading, 0.05, 0.25,
                                            "Demucs: "));
    transcriber->ensureLoaded(stageCallback(PipelineStage::modelLoading, 0.3, 0.2,
                                            "Basic-Pitch: "));
  } catch (const ModelError &e) {
    auto message = "AI model initialization failed: " + juce::String(e.what());
    if (isOutOfMemoryMessage(e.what()))
      message << "\n\nThis is likely due to insufficient GPU memory. Available: "
              << formatGb(getDeviceInfo())
              << ". Try using a smaller audio file or running without AI models.";
    return abortWith(result, message, classifyError(e));
  }

  reportProgress(PipelineStage::modelLoading, 0.5, 1.0, "AI models ready");

  const auto deviceInfo = getDeviceInfo();
  result.modelInfo = buildModelInfo(deviceInfo);

  // Separation
  std::vector<SeparatedStem> stems;
  if (config.enableSeparation) {
    logMemoryAdvisory(separator->getDiagnostics(), audio.getNumChannels(),
                      audio.getNumSamples(), audio.sampleRate, "separation");

    reportProgress(PipelineStage::sourceSeparation, 0.5, 0.0,
                   "Separating sources with " + separator->getModelName() + "...");
    auto separated = runStage(PipelineStage::sourceSeparation, std::vector<SeparatedStem>{}, [&] {
      try {
        return separator->separate(audio, stageCallback(PipelineStage::sourceSeparation,
                                                        0.5, 0.2, {}));
      } catch (const std::exception &e) {
        if (!isOutOfMemoryMessage(e.what()))
          throw;
        throw InferenceError(separator->getModelName(),
                             "Out of GPU memory during source separation. Available: " +
                                 formatGb(deviceInfo) +
                                 ". Try using a shorter audio file or disable separation.",
                             e.what());
      }
    });
    if (separated.aborted())
      return abortWith(result, separated);

    stems = std::move(separated.value);
    result.separationEnabled = true;
    result.stemCount = (int)stems.size();
  } else {
    SeparatedStem mix;
    mix.name = "mix";
    mix.samples = audio.samples;
    mix.sampleRate = audio.sampleRate;
    stems.push_back(std::move(mix));
    result.separationEnabled = false;
    result.stemCount = 1;
  }

  // Transcription, one stem at a time
  if (const auto *diagnostics = transcriber->getDiagnostics()) {
    int longest = 0, widest = 0;
    for (const auto &stem : stems) {
      longest = juce::jmax(longest, stem.samples.getNumSamples());
      widest = juce::jmax(widest, stem.samples.getNumChannels());
    }
    logMemoryAdvisory(diagnostics, widest, longest, audio.sampleRate, "transcription");
  }

  reportProgress(PipelineStage::polyphonicTranscription, 0.7, 0.0,
                 "Transcribing stems with Basic-Pitch...");

  StemNoteMap stemNotes;
  const double share = 0.2 / (double)juce::jmax<size_t>(1, stems.size());

  for (size_t i = 0; i < stems.size(); ++i) {
    const auto &stem = stems[i];
    auto transcribed = runStage(PipelineStage::polyphonicTranscription,
                                std::vector<NoteEvent>{}, [&] {
      try {
        return convertTranscribedNotes(transcriber->transcribeStem(
            stem, stageCallback(PipelineStage::polyphonicTranscription,
                                0.7 + share * (double)i, share, stem.name + ": ", 0.9)));
      } catch (const std::exception &e) {
        if (!isOutOfMemoryMessage(e.what()))
          throw;
        throw InferenceError(transcriber->getModelName(),
                             "Out of GPU memory during " + stem.name +
                                 " transcription. Available: " + formatGb(deviceInfo) +
                                 ". Try using a shorter audio file or disable AI features.",
                             e.what());
      }
    });
    if (transcribed.aborted())
      return abortWith(result, transcribed);

    stemNotes.push_back({stem.name, std::move(transcribed.value)});
  }

  // Tempo
  double tempoBpm = config.tempo;
  if (config.detectTempo)
    if (auto info = detectTempo(audio, 0.92, result))
      tempoBpm = info->tempoBpm;

  // Per-stem clean-up
  reportProgress(PipelineStage::noteFiltering, 0.93, 0.0, "Filtering notes...");
  int totalFiltered = 0;
  for (auto &stem : stemNotes) {
    int removed = 0;
    stem.notes = filterNotes(stem.notes, stem.stemName, removed);
    totalFiltered += removed;
  }
  result.notesFiltered = totalFiltered;
  if (totalFiltered > 0)
    juce::Logger::writeToLog("Filtered " + juce::String(totalFiltered) +
                             " total notes across all stems");

  if (config.quantizationEnabled) {
    reportProgress(PipelineStage::quantization, 0.94, 0.0, "Quantizing notes...");
    bool anyApplied = false;
    for (auto &stem : stemNotes) {
      bool applied = false;
      stem.notes = quantizeNotes(stem.notes, tempoBpm, stem.stemName, applied);
      anyApplied = anyApplied || applied;
    }
    result.quantizationApplied = anyApplied;
  }

  // MIDI
  reportProgress(PipelineStage::midiGeneration, 0.95, 0.0,
                 "Generating multi-track MIDI (AI)...");
  juce::File target;
  auto midi = runStage(PipelineStage::midiGeneration, std::optional<MidiInfo>{}, [&] {
    auto info = MidiGenerator::getMidiInfo(stemNotes);
    if (info.noteCount == 0)
      throw MidiGenerationError(MidiGenerationError::Reason::noNotes,
                                "No note events were transcribed in any stem");

    target = resolveOutputFile(audio, outputFile);
    MidiGenerator generator(tempoBpm);
    generator.createMultiTrackMidi(stemNotes).writeTo(target);
    return std::optional<MidiInfo>(std::move(info));
  });
  if (midi.aborted())
    return abortWith(result, midi);

  result.success = true;
  result.outputFile = target;
  result.noteCount = midi.value->noteCount;
  result.duration = midi.value->duration;
  result.transcriptionMethod = "polyphonic";

  reportProgress(PipelineStage::complete, 1.0, 1.0, "AI conversion complete");
  return juce::Result::ok();
}

// ---------------------------------------------------------------------------
// Shared stages
// ---------------------------------------------------------------------------

std::optional<TempoInfo> AudioToMidiPipeline::detectTempo(const AudioData &audio,
                                                          double progressValue,
                                                          PipelineResult &result) {
  reportProgress(PipelineStage::tempoDetection, progressValue, 0.0, "Detecting tempo...");

  auto outcome = runStage(PipelineStage::tempoDetection, std::optional<TempoInfo>{}, [&] {
    return std::optional<TempoInfo>(tempoDetector.detectTempo(audio));
  });

  if (outcome.fellBack || !outcome.value.has_value()) {
    juce::Logger::writeToLog("Warning: using default tempo of " +
                             juce::String(config.tempo, 1) + " BPM");
    return std::nullopt;
  }

  result.detectedTempo = outcome.value->tempoBpm;
  result.beatTimes = outcome.value->beatTimes;
  return outcome.value;
}

std::vector<NoteEvent> AudioToMidiPipeline::filterNotes(const std::vector<NoteEvent> &notes,
                                                        const juce::String &label,
                                                        int &removed) {
  removed = 0;
  auto outcome = runStage(PipelineStage::noteFiltering, notes,
                          [&] { return noteFilter.filterNotes(notes).notes; });

  if (!outcome.fellBack) {
    removed = (int)notes.size() - (int)outcome.value.size();
    if (!notes.empty())
      juce::Logger::writeToLog("Filtered " + juce::String(removed) + " " + label + " (" +
                               juce::String(100.0 * removed / (double)notes.size(), 1) +
                               "% removed)");
  }
  return outcome.value;
}

std::vector<NoteEvent> AudioToMidiPipeline::quantizeNotes(const std::vector<NoteEvent> &notes,
                                                          double tempoBpm,
                                                          const juce::String &label,
                                                          bool &applied) {
  applied = false;
  if (notes.empty())
    return notes;

  const NoteQuantizer quantizer(config.quantizationGrid);
  auto outcome = runStage(PipelineStage::quantization, notes,
                          [&] { return quantizer.quantizeNotes(notes, tempoBpm); });

  if (!outcome.fellBack && config.quantizationGrid != QuantizationGrid::none) {
    applied = true;
    juce::Logger::writeToLog("Quantized " + juce::String((int)outcome.value.size()) + " " +
                             label + " to " +
                             NoteQuantizer::gridName(config.quantizationGrid) + " grid");
  }
  return outcome.value;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void AudioToMidiPipeline::logMemoryAdvisory(const DeviceDiagnostics *diagnostics,
                                            int numChannels, int numSamples,
                                            double sampleRate,
                                            const juce::String &task) const {
  if (diagnostics == nullptr)
    return;

  try {
    const auto info = diagnostics->getDeviceInfo();
    const double requiredMb =
        diagnostics->estimateMemoryRequirementMb(numChannels, numSamples, sampleRate);

    juce::Logger::writeToLog("Estimated memory required for " + task + ": " +
                             juce::String(requiredMb, 2) + " MB");

    if (info.memoryGb.has_value() && requiredMb > *info.memoryGb * 1024.0 * 0.8)
      juce::Logger::writeToLog("Warning: High memory usage: " +
                               juce::String(requiredMb, 2) + " MB required (" +
                               formatGb(info) + " available). " +
                               task.substring(0, 1).toUpperCase() + task.substring(1) +
                               " may fail with an out-of-memory error.");
  } catch (const std::exception &e) {
    juce::Logger::writeToLog("Warning: Could not estimate memory requirements: " +
                             juce::String(e.what()));
  }
}

juce::File AudioToMidiPipeline::resolveOutputFile(const AudioData &audio,
                                                  const juce::File &requested) const {
  if (requested != juce::File())
    return requested;

  if (audio.sourceFile == juce::File())
    throw InvalidInputError("No output path provided and audio has no source file");

  auto target = audio.sourceFile.withFileExtension(".mid");
  if (config.outputDirectory != juce::File())
    target = config.outputDirectory.getChildFile(target.getFileName());
  return target;
}

void AudioToMidiPipeline::reportProgress(PipelineStage stage, double progress,
                                         double stageProgress,
                                         const juce::String &message) {
  progress = juce::jlimit(lastProgress, 1.0, progress);
  lastProgress = progress;

  DBG("[" << stageName(stage).toUpperCase() << "] "
          << juce::String(progress * 100.0, 1) << "% - " << message);

  if (!progressCallback)
    return;

  try {
    progressCallback({stage, progress, juce::jlimit(0.0, 1.0, stageProgress), message});
  } catch (const std::exception &e) {
    juce::Logger::writeToLog("Warning: Progress callback failed: " + juce::String(e.what()));
  } catch (...) {
    juce::Logger::writeToLog("Warning: Progress callback failed with an unknown exception");
  }
}

ModelProgressCallback AudioToMidiPipeline::stageCallback(PipelineStage stage, double base,
                                                         double span,
                                                         const juce::String &prefix,
                                                         double cap) {
  const auto range = aiStageRange(stage);

  return [this, stage, base, span, prefix, cap, range](double value,
                                                       const juce::String &message) {
    const double v = juce::jlimit(0.0, 1.0, value);
    const double progress = juce::jmin(cap, base + span * v);
    // Several callbacks can share one stage, so stage progress follows the
    // file position rather than this callback's own fraction.
    const double withinStage = (progress - range.first) / (range.second - range.first);
    reportProgress(stage, progress, withinStage, prefix + message);
  };
}

juce::var AudioToMidiPipeline::buildModelInfo(const DeviceInfo &deviceInfo) const {
  auto *obj = new juce::DynamicObject();
  obj->setProperty("device_info", deviceInfo.toVar());
  obj->setProperty("demucs_model", separator != nullptr ? juce::var(separator->getModelName())
                                                        : juce::var());
  obj->setProperty("basic_pitch_model", transcriber->getModelName());
  obj->setProperty("basic_pitch_config", config.transcription.toVar());
  obj->setProperty("device", config.device);
  obj->setProperty("models_cache_dir",
                   config.modelsCacheDir != juce::File()
                       ? juce::var(config.modelsCacheDir.getFullPathName())
                       : juce::var());
  return juce::var(obj);
}
