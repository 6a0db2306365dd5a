// Tests for ConversionWorker.h -- batch conversion, failure isolation and
// cancellation between files.

#include "ConversionWorker.h"
#include "TestSignals.h"

#include <gtest/gtest.h>

#include <functional>

namespace {

struct RecordingListener : ConversionWorker::Listener {
  void conversionProgress(double overall, const juce::String &message) override {
    progress.push_back(overall);
    messages.add(message);
  }

  void fileCompleted(const juce::File &file, const PipelineResult &result) override {
    completed.add(file.getFileName());
    results.push_back(result);
    if (onCompleted)
      onCompleted();
  }

  void fileFailed(const juce::File &file, const juce::String &errorMessage) override {
    failed.add(file.getFileName());
    errors.add(errorMessage);
  }

  void allCompleted(int ok, int bad) override {
    ++finishedCalls;
    finalSuccess = ok;
    finalErrors = bad;
  }

  std::vector<double> progress;
  juce::StringArray messages, completed, failed, errors;
  std::vector<PipelineResult> results;
  std::function<void()> onCompleted;
  int finishedCalls = 0;
  int finalSuccess = -1;
  int finalErrors = -1;
};

PipelineConfig batchConfig(const juce::File &outputDir) {
  PipelineConfig config;
  config.detectTempo = false;
  config.outputDirectory = outputDir;
  return config;
}

std::vector<juce::File> writeSines(TestSignals::ScopedTempDir &dir,
                                   std::initializer_list<const char *> names) {
  std::vector<juce::File> files;
  double freq = 220.0;
  for (auto *name : names) {
    const auto file = dir.file(name);
    EXPECT_TRUE(TestSignals::writeWav(file, TestSignals::makeSine(freq, 1.0)));
    files.push_back(file);
    freq *= 1.5;
  }
  return files;
}

TEST(ConversionWorkerTest, OutputFileFor) {
  const auto input = juce::File::getSpecialLocation(juce::File::tempDirectory)
                         .getChildFile("in/song.take2.wav");
  EXPECT_EQ(ConversionWorker::outputFileFor(input, {}),
            input.getSiblingFile("song.take2.mid"));

  const auto outDir = input.getParentDirectory().getSiblingFile("out");
  EXPECT_EQ(ConversionWorker::outputFileFor(input, outDir),
            outDir.getChildFile("song.take2.mid"));
}

TEST(ConversionWorkerTest, DescribeFailureAppendsHint) {
  PipelineResult result;
  result.errorMessage = "Out of GPU memory";
  result.errorKind = ErrorKind::inference;
  const auto text = ConversionWorker::describeFailure(result);
  EXPECT_TRUE(text.startsWith("Out of GPU memory\n\n"));
  EXPECT_EQ(text.fromFirstOccurrenceOf("\n\n", false, false),
            remediationHint(ErrorKind::inference));

  PipelineResult bare;
  bare.errorKind = ErrorKind::none;
  EXPECT_EQ(ConversionWorker::describeFailure(bare), "Unknown error");
}

TEST(ConversionWorkerTest, BadFileDoesNotStopTheBatch) {
  TestSignals::ScopedTempDir dir;
  auto files = writeSines(dir, {"one.wav", "two.wav"});
  files.insert(files.begin() + 1, dir.file("missing.wav"));

  const auto outDir = dir.file("midi");
  ConversionWorker worker(files, batchConfig(outDir));
  RecordingListener listener;
  worker.addListener(&listener);
  worker.processAll();

  EXPECT_EQ(worker.getSuccessCount(), 2);
  EXPECT_EQ(worker.getErrorCount(), 1);
  EXPECT_EQ(listener.completed, juce::StringArray({"one.wav", "two.wav"}));
  ASSERT_EQ(listener.failed.size(), 1);
  EXPECT_EQ(listener.failed[0], "missing.wav");
  EXPECT_TRUE(listener.errors[0].contains("Failed to load")) << listener.errors[0];
  EXPECT_TRUE(listener.errors[0].contains("readable WAV")) << listener.errors[0];

  EXPECT_EQ(listener.finishedCalls, 1);
  EXPECT_EQ(listener.finalSuccess, 2);
  EXPECT_EQ(listener.finalErrors, 1);

  EXPECT_TRUE(outDir.getChildFile("one.mid").existsAsFile());
  EXPECT_TRUE(outDir.getChildFile("two.mid").existsAsFile());
  EXPECT_FALSE(outDir.getChildFile("missing.mid").exists());
  for (const auto &r : listener.results)
    EXPECT_GE(r.noteCount, 1);
}

TEST(ConversionWorkerTest, BatchProgressIsMonotonic) {
  TestSignals::ScopedTempDir dir;
  const auto files = writeSines(dir, {"a.wav", "b.wav", "c.wav"});

  ConversionWorker worker(files, batchConfig(dir.file("out")));
  RecordingListener listener;
  worker.addListener(&listener);
  worker.processAll();

  ASSERT_FALSE(listener.progress.empty());
  EXPECT_DOUBLE_EQ(listener.progress.front(), 0.0);
  for (size_t i = 1; i < listener.progress.size(); ++i)
    EXPECT_GE(listener.progress[i], listener.progress[i - 1] - 1e-9)
        << listener.messages[(int)i];
  EXPECT_DOUBLE_EQ(listener.progress.back(), 1.0);
  EXPECT_EQ(listener.messages[listener.messages.size() - 1], "All files processed");
  EXPECT_TRUE(listener.messages.contains("Processing b.wav..."));
}

TEST(ConversionWorkerTest, CancelStopsBeforeNextFile) {
  TestSignals::ScopedTempDir dir;
  const auto files = writeSines(dir, {"first.wav", "second.wav", "third.wav"});

  ConversionWorker worker(files, batchConfig(dir.file("out")));
  RecordingListener listener;
  listener.onCompleted = [&worker] { worker.cancel(); };
  worker.addListener(&listener);
  worker.processAll();

  EXPECT_TRUE(worker.isCancelled());
  EXPECT_EQ(listener.completed, juce::StringArray({"first.wav"}));
  EXPECT_EQ(listener.finishedCalls, 1);
  EXPECT_EQ(listener.finalSuccess, 1);
  EXPECT_EQ(listener.finalErrors, 0);
  EXPECT_FALSE(listener.messages.contains("All files processed"));
  EXPECT_FALSE(dir.file("out/second.mid").exists());
}

TEST(ConversionWorkerTest, EmptyBatchStillFinishes) {
  ConversionWorker worker({}, PipelineConfig());
  RecordingListener listener;
  worker.addListener(&listener);
  worker.processAll();

  EXPECT_TRUE(listener.progress.empty());
  EXPECT_EQ(listener.finishedCalls, 1);
  EXPECT_EQ(listener.finalSuccess, 0);
  EXPECT_EQ(listener.finalErrors, 0);
}

TEST(ConversionWorkerTest, AiBatchSharesModels) {
  TestSignals::ScopedTempDir dir;
  const auto files = writeSines(dir, {"x.wav", "y.wav"});

  TestSignals::FakeFactory fakes;
  fakes.transcriber->notesByStem["mix"] = {TestSignals::makeTranscribed(0.0, 0.5, 60)};

  auto config = batchConfig(dir.file("out"));
  config.useAiModels = true;

  ConversionWorker worker(files, config, fakes.make());
  worker.processAll();

  EXPECT_EQ(worker.getSuccessCount(), 2);
  EXPECT_EQ(*fakes.transcriberRequests, 1);
  EXPECT_EQ(fakes.transcriber->transcribedStems, juce::StringArray({"mix", "mix"}));
}

TEST(ConversionWorkerTest, RunsOnItsOwnThread) {
  TestSignals::ScopedTempDir dir;
  const auto files = writeSines(dir, {"threaded.wav"});

  ConversionWorker worker(files, batchConfig(dir.file("out")));
  RecordingListener listener;
  worker.addListener(&listener);

  ASSERT_TRUE(worker.startThread());
  ASSERT_TRUE(worker.waitForThreadToExit(30000));

  EXPECT_EQ(listener.finishedCalls, 1);
  EXPECT_EQ(worker.getSuccessCount(), 1);
  EXPECT_TRUE(dir.file("out/threaded.mid").existsAsFile());
}

} // namespace
