#pragma once

// Synthetic signals and fake model collaborators shared by the tests.

#include "ModelBackends.h"
#include "NoteTypes.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <atomic>
#include <cmath>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace TestSignals {

constexpr double defaultRate = 22050.0;

inline AudioData makeSine(double frequency, double seconds,
                          double sampleRate = defaultRate, float amplitude = 0.5f,
                          int numChannels = 1) {
  const int numSamples = (int)(seconds * sampleRate);
  juce::AudioBuffer<float> buffer(numChannels, numSamples);
  for (int ch = 0; ch < numChannels; ++ch)
    for (int i = 0; i < numSamples; ++i)
      buffer.setSample(ch, i,
                       amplitude * (float)std::sin(2.0 * juce::MathConstants<double>::pi *
                                                   frequency * i / sampleRate));
  return AudioData(std::move(buffer), sampleRate);
}

/** Sine notes played back to back, each with a short fade in and out. */
inline AudioData makeMelody(const std::vector<double> &frequencies,
                            double noteSeconds, double sampleRate = defaultRate,
                            float amplitude = 0.5f) {
  const int perNote = (int)(noteSeconds * sampleRate);
  const int fade = (int)(0.005 * sampleRate);
  juce::AudioBuffer<float> buffer(1, perNote * (int)frequencies.size());
  buffer.clear();

  for (size_t n = 0; n < frequencies.size(); ++n) {
    for (int i = 0; i < perNote; ++i) {
      float gain = amplitude;
      if (i < fade)
        gain *= (float)i / (float)fade;
      else if (i > perNote - fade)
        gain *= (float)(perNote - i) / (float)fade;

      const double phase =
          2.0 * juce::MathConstants<double>::pi * frequencies[n] * i / sampleRate;
      buffer.setSample(0, (int)n * perNote + i, gain * (float)std::sin(phase));
    }
  }
  return AudioData(std::move(buffer), sampleRate);
}

/** Short decaying noise bursts on every beat. */
inline AudioData makeClickTrack(double bpm, double seconds,
                                double sampleRate = defaultRate) {
  const int numSamples = (int)(seconds * sampleRate);
  const int clickLength = (int)(0.02 * sampleRate);
  const double beatSamples = 60.0 / bpm * sampleRate;

  juce::AudioBuffer<float> buffer(1, numSamples);
  buffer.clear();
  juce::Random random(42);

  for (double pos = 0.0; pos < numSamples; pos += beatSamples) {
    const int start = (int)pos;
    for (int i = 0; i < clickLength && start + i < numSamples; ++i) {
      const float decay = std::exp(-5.0f * (float)i / (float)clickLength);
      buffer.setSample(0, start + i, 0.9f * decay * (random.nextFloat() * 2.0f - 1.0f));
    }
  }
  return AudioData(std::move(buffer), sampleRate);
}

inline AudioData makeSilence(double seconds, double sampleRate = defaultRate) {
  juce::AudioBuffer<float> buffer(1, (int)(seconds * sampleRate));
  buffer.clear();
  return AudioData(std::move(buffer), sampleRate);
}

inline NoteEvent makeNote(double start, double end, int midiNote = 60,
                          int velocity = 80, double confidence = 0.9) {
  NoteEvent n;
  n.startTime = start;
  n.endTime = end;
  n.midiNote = midiNote;
  n.pitchHz = NoteUtils::midiToHz((double)midiNote);
  n.velocity = velocity;
  n.confidence = confidence;
  return n;
}

inline TranscribedNote makeTranscribed(double start, double end, int pitch,
                                       double amplitude = 0.8) {
  return {start, end, pitch, amplitude};
}

/** Writes a 16-bit WAV file; returns false if the writer could not be created. */
inline bool writeWav(const juce::File &file, const AudioData &audio) {
  file.deleteFile();
  auto stream = std::make_unique<juce::FileOutputStream>(file);
  if (!stream->openedOk())
    return false;

  juce::WavAudioFormat wav;
  std::unique_ptr<juce::AudioFormatWriter> writer(
      wav.createWriterFor(stream.get(), audio.sampleRate,
                          (unsigned int)audio.getNumChannels(), 16,
                          juce::StringPairArray(), 0));
  if (writer == nullptr)
    return false;

  stream.release(); // now owned by the writer
  return writer->writeFromAudioSampleBuffer(audio.samples, 0, audio.getNumSamples());
}

/** A fresh directory under the temp folder, removed again on destruction. */
class ScopedTempDir {
public:
  ScopedTempDir()
      : dir(juce::File::getSpecialLocation(juce::File::tempDirectory)
                .getNonexistentChildFile("audio2midi_test", "", false)) {
    dir.createDirectory();
  }
  ~ScopedTempDir() { dir.deleteRecursively(); }

  const juce::File &get() const { return dir; }
  juce::File file(const juce::String &name) const { return dir.getChildFile(name); }

private:
  juce::File dir;
};

//==============================================================================
class FakeDiagnostics : public DeviceDiagnostics {
public:
  explicit FakeDiagnostics(std::optional<double> gb, double estimateMb = 512.0)
      : memoryGb(gb), requiredMb(estimateMb) {}

  DeviceInfo getDeviceInfo() const override {
    DeviceInfo info;
    info.deviceType = "cuda";
    info.deviceName = "Fake GPU";
    info.acceleratorAvailable = true;
    info.memoryGb = memoryGb;
    return info;
  }

  double estimateMemoryRequirementMb(int, int, double) const override {
    return requiredMb;
  }

private:
  std::optional<double> memoryGb;
  double requiredMb;
};

//==============================================================================
/** Installs itself as the current logger and records every line. */
class CapturingLogger : public juce::Logger {
public:
  CapturingLogger() { juce::Logger::setCurrentLogger(this); }
  ~CapturingLogger() override { juce::Logger::setCurrentLogger(nullptr); }

  bool contains(const juce::String &text) const {
    const juce::ScopedLock sl(lock);
    for (const auto &line : lines)
      if (line.contains(text))
        return true;
    return false;
  }

protected:
  void logMessage(const juce::String &message) override {
    const juce::ScopedLock sl(lock);
    lines.add(message);
  }

private:
  juce::CriticalSection lock;
  juce::StringArray lines;
};

/** Returns a copy of the input under each configured stem name. */
class FakeSeparator : public SourceSeparator {
public:
  explicit FakeSeparator(juce::StringArray names = {"vocals", "drums", "bass", "other"})
      : stemNames(std::move(names)) {}

  juce::String getModelName() const override { return "fake_demucs"; }

  void ensureLoaded(const ModelProgressCallback &progress) override {
    ++loadCount;
    if (progress)
      progress(1.0, "loaded");
  }

  std::vector<SeparatedStem> separate(const AudioData &audio,
                                      const ModelProgressCallback &progress) override {
    ++separateCount;
    if (failure.isNotEmpty())
      throw std::runtime_error(failure.toStdString());

    std::vector<SeparatedStem> stems;
    for (int i = 0; i < stemNames.size(); ++i) {
      SeparatedStem stem;
      stem.name = stemNames[i];
      stem.samples = audio.samples;
      stem.sampleRate = audio.sampleRate;
      stems.push_back(std::move(stem));
      if (progress)
        progress((double)(i + 1) / stemNames.size(), "separated " + stemNames[i]);
    }
    return stems;
  }

  const DeviceDiagnostics *getDiagnostics() const override { return diagnostics.get(); }

  juce::StringArray stemNames;
  juce::String failure; // thrown from separate() when set
  std::unique_ptr<DeviceDiagnostics> diagnostics;
  int loadCount = 0;
  int separateCount = 0;
};

/** Returns canned notes per stem name. */
class FakeTranscriber : public PolyphonicTranscriber {
public:
  juce::String getModelName() const override { return "fake_basic_pitch"; }

  void ensureLoaded(const ModelProgressCallback &progress) override {
    ++loadCount;
    if (progress)
      progress(1.0, "loaded");
  }

  std::vector<TranscribedNote> transcribeStem(const SeparatedStem &stem,
                                              const ModelProgressCallback &progress) override {
    transcribedStems.add(stem.name);
    if (failure.isNotEmpty())
      throw std::runtime_error(failure.toStdString());

    if (progress) {
      progress(0.5, "halfway");
      progress(1.0, "done");
    }

    auto it = notesByStem.find(stem.name);
    return it != notesByStem.end() ? it->second : std::vector<TranscribedNote>{};
  }

  const DeviceDiagnostics *getDiagnostics() const override { return diagnostics.get(); }

  std::map<juce::String, std::vector<TranscribedNote>> notesByStem;
  juce::String failure;
  std::unique_ptr<DeviceDiagnostics> diagnostics;
  juce::StringArray transcribedStems;
  int loadCount = 0;
};

/** Factory handing out the given fakes and counting how often it is asked. */
struct FakeFactory {
  std::shared_ptr<FakeSeparator> separator = std::make_shared<FakeSeparator>();
  std::shared_ptr<FakeTranscriber> transcriber = std::make_shared<FakeTranscriber>();
  std::shared_ptr<std::atomic<int>> separatorRequests = std::make_shared<std::atomic<int>>(0);
  std::shared_ptr<std::atomic<int>> transcriberRequests = std::make_shared<std::atomic<int>>(0);

  ModelBackendFactory make() const {
    ModelBackendFactory factory;
    auto sep = separator;
    auto tr = transcriber;
    auto sepCount = separatorRequests;
    auto trCount = transcriberRequests;

    factory.createSeparator = [sep, sepCount](const juce::String &, const juce::String &,
                                              const juce::File &) {
      ++*sepCount;
      return ModelBackend<SourceSeparator>::available(sep);
    };
    factory.createTranscriber = [tr, trCount](const TranscriptionSettings &,
                                              const juce::String &, const juce::File &) {
      ++*trCount;
      return ModelBackend<PolyphonicTranscriber>::available(tr);
    };
    return factory;
  }
};

} // namespace TestSignals
