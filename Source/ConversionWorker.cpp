#include "ConversionWorker.h"

ConversionWorker::ConversionWorker(std::vector<juce::File> inputFiles,
                                   PipelineConfig c, ModelBackendFactory factory,
                                   std::shared_ptr<ModelCache> cache)
    : juce::Thread("ConversionWorker"), files(std::move(inputFiles)),
      config(std::move(c)), backendFactory(std::move(factory)),
      modelCache(cache != nullptr ? std::move(cache) : std::make_shared<ModelCache>()) {}

juce::File ConversionWorker::outputFileFor(const juce::File &input,
                                           const juce::File &outputDir) {
  const auto name = input.getFileNameWithoutExtension() + ".mid";
  if (outputDir != juce::File())
    return outputDir.getChildFile(name);
  return input.getSiblingFile(name);
}

juce::String ConversionWorker::describeFailure(const PipelineResult &result) {
  auto message = result.errorMessage.isNotEmpty() ? result.errorMessage
                                                  : juce::String("Unknown error");
  const auto hint = remediationHint(result.errorKind);
  if (hint.isNotEmpty())
    message << "\n\n" << hint;
  return message;
}

void ConversionWorker::notifyProgress(double overall, const juce::String &message) {
  listeners.call([&](Listener &l) { l.conversionProgress(overall, message); });
}

PipelineProgressCallback ConversionWorker::makeProgressCallback(int fileIndex,
                                                                int totalFiles) {
  const auto mode = config.useAiModels ? PipelineMode::ai : PipelineMode::monophonic;

  return [this, mode, fileIndex, totalFiles](const PipelineProgress &p) {
    if (cancelled)
      return;

    const double overall =
        overallProgress(mode, fileIndex, totalFiles, p.stage, p.stageProgress);
    notifyProgress(overall, "[" + stageTitle(p.stage) + "] " + p.message);
  };
}

void ConversionWorker::processAll() {
  successCount = 0;
  errorCount = 0;
  const int total = (int)files.size();

  for (int i = 0; i < total; ++i) {
    if (cancelled || threadShouldExit()) {
      juce::Logger::writeToLog("Conversion cancelled by user");
      break;
    }

    const auto &input = files[(size_t)i];
    notifyProgress((double)i / (double)total, "Processing " + input.getFileName() + "...");

    PipelineResult result;
    try {
      const auto audio = loader.load(input);
      AudioToMidiPipeline pipeline(config, makeProgressCallback(i, total),
                                   backendFactory, modelCache);
      result = pipeline.process(audio, outputFileFor(input, config.outputDirectory));
    } catch (const std::exception &e) {
      result.success = false;
      result.errorMessage = e.what();
      result.errorKind = classifyError(e);
    }

    if (result.success) {
      ++successCount;
      listeners.call([&](Listener &l) { l.fileCompleted(input, result); });
    } else {
      ++errorCount;
      const auto message = describeFailure(result);
      juce::Logger::writeToLog("Error: " + input.getFileName() + ": " + message);
      listeners.call([&](Listener &l) { l.fileFailed(input, message); });
    }
  }

  if (!cancelled && total > 0)
    notifyProgress(1.0, "All files processed");

  const int ok = successCount, failed = errorCount;
  listeners.call([ok, failed](Listener &l) { l.allCompleted(ok, failed); });
}
