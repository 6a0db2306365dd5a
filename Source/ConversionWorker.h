#pragma once

#include "AudioFileLoader.h"
#include "AudioToMidiPipeline.h"
#include <atomic>
#include <juce_core/juce_core.h>
#include <memory>
#include <vector>

/**
 * ConversionWorker
 *
 * Converts a batch of audio files one after another on a background
 * juce::Thread. Models resolved for the first file are reused for the rest
 * through a shared ModelCache.
 *
 * Cancellation is only looked at between files; a file that has started is
 * always finished. Listener callbacks arrive on the worker thread.
 */
class ConversionWorker : public juce::Thread {
public:
  class Listener {
  public:
    virtual ~Listener() = default;

    /** overall is 0..1 across the whole batch. */
    virtual void conversionProgress(double overall, const juce::String &message) {
      juce::ignoreUnused(overall, message);
    }
    virtual void fileCompleted(const juce::File &file, const PipelineResult &result) {
      juce::ignoreUnused(file, result);
    }
    virtual void fileFailed(const juce::File &file, const juce::String &errorMessage) {
      juce::ignoreUnused(file, errorMessage);
    }
    virtual void allCompleted(int successCount, int errorCount) {
      juce::ignoreUnused(successCount, errorCount);
    }
  };

  ConversionWorker(std::vector<juce::File> files, PipelineConfig config,
                   ModelBackendFactory backendFactory =
                       ModelBackendFactory::withoutBundledModels(),
                   std::shared_ptr<ModelCache> modelCache = nullptr);

  ~ConversionWorker() override { stopThread(4000); }

  void addListener(Listener *l) { listeners.add(l); }
  void removeListener(Listener *l) { listeners.remove(l); }

  /** Stops the batch before the next file. */
  void cancel() { cancelled = true; }
  bool isCancelled() const { return cancelled; }

  /** Runs the whole batch on the calling thread. */
  void processAll();

  int getSuccessCount() const { return successCount; }
  int getErrorCount() const { return errorCount; }

  /** <outputDir>/<name>.mid, or next to the input when outputDir is unset. */
  static juce::File outputFileFor(const juce::File &input, const juce::File &outputDir);

  /** The error text shown for a failed file, with advice appended. */
  static juce::String describeFailure(const PipelineResult &result);

private:
  void run() override { processAll(); }

  PipelineProgressCallback makeProgressCallback(int fileIndex, int totalFiles);
  void notifyProgress(double overall, const juce::String &message);

  std::vector<juce::File> files;
  PipelineConfig config;
  ModelBackendFactory backendFactory;
  std::shared_ptr<ModelCache> modelCache;
  AudioFileLoader loader;

  juce::ListenerList<Listener> listeners;
  std::atomic<bool> cancelled{false};
  std::atomic<int> successCount{0};
  std::atomic<int> errorCount{0};

  JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ConversionWorker)
};
