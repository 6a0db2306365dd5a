#pragma once
#include "NoteTypes.h"
#include <juce_audio_formats/juce_audio_formats.h>

/**
 * AudioFileLoader
 *
 * Decodes an audio file into an AudioData buffer with juce's registered
 * formats (WAV, AIFF, FLAC, Ogg Vorbis, MP3).
 *
 * Usage:
 *   AudioFileLoader loader;
 *   auto audio = loader.load(file); // throws AudioLoadError
 */
class AudioFileLoader {
public:
  AudioFileLoader();

  /** Throws AudioLoadError for unsupported, unreadable or empty files. */
  AudioData load(const juce::File &file);

  static bool isSupportedFile(const juce::String &fileName) {
    const auto name = fileName.toLowerCase();
    return name.endsWith(".wav") || name.endsWith(".mp3") ||
           name.endsWith(".flac") || name.endsWith(".ogg") ||
           name.endsWith(".aif") || name.endsWith(".aiff");
  }

private:
  juce::AudioFormatManager formatManager;

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioFileLoader)
};
