#include "AudioFileLoader.h"
#include "Audio2MidiErrors.h"

AudioFileLoader::AudioFileLoader() { formatManager.registerBasicFormats(); }

AudioData AudioFileLoader::load(const juce::File &file) {
  if (!file.existsAsFile())
    throw AudioLoadError(file, "file does not exist");

  if (!isSupportedFile(file.getFileName()))
    throw AudioLoadError(file, "unsupported file type '" +
                                   file.getFileExtension() + "'");

  std::unique_ptr<juce::AudioFormatReader> reader(
      formatManager.createReaderFor(file));

  if (reader == nullptr)
    throw AudioLoadError(file, "no decoder could read the file");

  if (reader->sampleRate <= 0.0)
    throw AudioLoadError(file, "invalid sample rate");

  const int numChannels = (int)reader->numChannels;
  const int numSamples = (int)reader->lengthInSamples;

  if (numChannels <= 0 || numSamples <= 0)
    throw AudioLoadError(file, "file contains no audio");

  juce::AudioBuffer<float> buffer(numChannels, numSamples);
  if (!reader->read(&buffer, 0, numSamples, 0, true, true))
    throw AudioLoadError(file, "decoding failed");

  juce::Logger::writeToLog("Loaded " + file.getFileName() + ": " +
                           juce::String(numChannels) + " ch, " +
                           juce::String(reader->sampleRate, 0) + " Hz, " +
                           juce::String((double)numSamples / reader->sampleRate, 2) +
                           " s");

  return AudioData(std::move(buffer), reader->sampleRate, file);
}
