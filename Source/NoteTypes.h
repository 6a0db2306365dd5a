#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

/** Pitch estimate for one analysis frame. */
struct PitchFrame {
  double time = 0.0;                 // seconds from the start of the audio
  std::optional<double> frequency;   // Hz, empty when unvoiced
  bool voiced = false;
  double confidence = 0.0;           // 0..1
};

/** A detected note. Stages copy these, they never edit them in place. */
struct NoteEvent {
  double startTime = 0.0;
  double endTime = 0.0;
  double pitchHz = 0.0;
  int midiNote = 60;    // 0..127
  int velocity = 64;    // 1..127
  double confidence = 1.0;

  double getDuration() const { return endTime - startTime; }

  bool operator==(const NoteEvent &other) const {
    return startTime == other.startTime && endTime == other.endTime &&
           pitchHz == other.pitchHz && midiNote == other.midiNote &&
           velocity == other.velocity && confidence == other.confidence;
  }
  bool operator!=(const NoteEvent &other) const { return !(*this == other); }
};

struct TempoInfo {
  double tempoBpm = 120.0;
  std::vector<double> beatTimes;
  double confidence = 0.0;
  std::pair<int, int> timeSignature{4, 4};
  bool isConstant = true;
};

/**
 * Decoded audio handed to the pipeline.
 *
 * The buffer is channels x samples; stages only ever read it.
 */
struct AudioData {
  AudioData() = default;
  AudioData(juce::AudioBuffer<float> buffer, double rate,
            juce::File file = {})
      : samples(std::move(buffer)), sampleRate(rate),
        sourceFile(std::move(file)) {}

  juce::AudioBuffer<float> samples;
  double sampleRate = 44100.0;
  juce::File sourceFile;

  int getNumSamples() const { return samples.getNumSamples(); }
  int getNumChannels() const { return samples.getNumChannels(); }

  bool isEmpty() const {
    return samples.getNumChannels() == 0 || samples.getNumSamples() == 0;
  }

  double getDurationSeconds() const {
    return sampleRate > 0.0 ? (double)getNumSamples() / sampleRate : 0.0;
  }

  /** Averages all channels into one signal. */
  std::vector<float> toMono() const {
    const int numChannels = getNumChannels();
    const int numSamples = getNumSamples();
    std::vector<float> mono((size_t)juce::jmax(0, numSamples), 0.0f);
    if (numChannels == 0)
      return mono;

    for (int ch = 0; ch < numChannels; ++ch) {
      const float *data = samples.getReadPointer(ch);
      for (int i = 0; i < numSamples; ++i)
        mono[(size_t)i] += data[i];
    }
    if (numChannels > 1) {
      const float scale = 1.0f / (float)numChannels;
      for (auto &s : mono)
        s *= scale;
    }
    return mono;
  }
};

/** One isolated source produced by a separation model. */
struct SeparatedStem {
  juce::String name;
  juce::AudioBuffer<float> samples;
  double sampleRate = 44100.0;
  std::optional<double> confidence;

  AudioData toAudioData() const {
    return AudioData(samples, sampleRate, juce::File());
  }
};

/** Per-stem note lists, kept in stem order. */
struct StemNotes {
  juce::String stemName;
  std::vector<NoteEvent> notes;
};

using StemNoteMap = std::vector<StemNotes>;

namespace NoteUtils {

/** Closest MIDI note number to a frequency, not clamped. */
inline int hzToMidi(double hz) {
  return (int)std::lround(12.0 * std::log2(hz / 440.0) + 69.0);
}

/** Fractional MIDI note number for a frequency. */
inline double hzToMidiFloat(double hz) {
  return 12.0 * std::log2(hz / 440.0) + 69.0;
}

inline double midiToHz(double midiNote) {
  return 440.0 * std::pow(2.0, (midiNote - 69.0) / 12.0);
}

inline int clampMidiNote(int note) { return juce::jlimit(0, 127, note); }

/**
 * Parses names such as "C2", "A4", "C#3" or "Bb-1" into a frequency.
 * Returns an empty optional when the text is not a note name.
 */
std::optional<double> noteNameToHz(const juce::String &name);

/** Accepts either a note name or a plain number of Hz. */
std::optional<double> parseFrequency(const juce::String &text);

} // namespace NoteUtils
