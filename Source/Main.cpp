#include "ConversionWorker.h"
#include <iostream>
#include <memory>

#ifndef AUDIO2MIDI_VERSION
#define AUDIO2MIDI_VERSION "0.0.0"
#endif

namespace {

/** Prints batch progress to the console. */
class ConsoleReporter : public ConversionWorker::Listener {
public:
  void conversionProgress(double overall, const juce::String &message) override {
    std::cout << "[" << juce::String(overall * 100.0, 0) << "%] " << message << std::endl;
  }

  void fileCompleted(const juce::File &file, const PipelineResult &result) override {
    std::cout << file.getFileName() << " -> " << result.outputFile.getFullPathName()
              << " (" << result.noteCount << " notes";
    if (result.detectedTempo.has_value())
      std::cout << ", " << juce::String(*result.detectedTempo, 1) << " BPM";
    std::cout << ")" << std::endl;
  }

  void fileFailed(const juce::File &file, const juce::String &errorMessage) override {
    std::cerr << file.getFileName() << ": " << errorMessage << std::endl;
  }

  void allCompleted(int successCount, int errorCount) override {
    std::cout << "Converted " << successCount << " file(s), " << errorCount
              << " failed" << std::endl;
  }
};

double parseNumber(const juce::ArgumentList &args, const juce::String &option) {
  const auto text = args.getValueForOption(option).trim();
  if (text.isEmpty() || !text.containsOnly("0123456789.-+eE"))
    juce::ConsoleApplication::fail("Expected a number for " + option + ", got '" +
                                   text + "'");
  return text.getDoubleValue();
}

PipelineConfig buildConfig(const juce::ArgumentList &args) {
  PipelineConfig config;

  if (args.containsOption("--config")) {
    const auto file = args.getExistingFileForOption("--config");
    config = PipelineConfig::loadFromFile(file);
  }

  if (args.containsOption("--output-dir"))
    config.outputDirectory = args.getFileForOption("--output-dir");

  if (args.containsOption("--tempo"))
    config.tempo = parseNumber(args, "--tempo");

  if (args.containsOption("--no-tempo-detection"))
    config.detectTempo = false;

  if (args.containsOption("--quantize")) {
    const auto name = args.getValueForOption("--quantize");
    const auto grid = NoteQuantizer::gridFromName(name);
    if (!grid.has_value())
      juce::ConsoleApplication::fail("Unknown quantization grid '" + name + "'");
    config.quantizationGrid = *grid;
    config.quantizationEnabled = *grid != QuantizationGrid::none;
  }

  if (args.containsOption("--min-note-duration")) {
    const double seconds = parseNumber(args, "--min-note-duration");
    config.minNoteDuration = seconds;
    config.filter.minDuration = seconds;
  }

  if (args.containsOption("--ai"))
    config.useAiModels = true;

  if (args.containsOption("--separate")) {
    config.useAiModels = true;
    config.enableSeparation = true;
  }

  if (args.containsOption("--preset")) {
    config.sensitivityPreset = args.getValueForOption("--preset");
    config.transcription = TranscriptionSettings::fromPreset(config.sensitivityPreset);
  }

  const auto check = config.validate();
  if (check.failed())
    juce::ConsoleApplication::fail("bad configuration: " + check.getErrorMessage());

  return config;
}

std::vector<juce::File> collectInputFiles(const juce::ArgumentList &args) {
  std::vector<juce::File> files;
  for (const auto &arg : args.arguments) {
    if (arg.isOption())
      continue;

    const auto file = arg.resolveAsFile();
    if (!AudioFileLoader::isSupportedFile(file.getFileName()))
      juce::Logger::writeToLog("Warning: " + file.getFileName() +
                               " does not look like a supported audio file");
    files.push_back(file);
  }

  if (files.empty())
    juce::ConsoleApplication::fail("No input files given. Try --help.");

  return files;
}

/** Installs a logger for the lifetime of the scope. */
struct ScopedCurrentLogger {
  explicit ScopedCurrentLogger(juce::Logger *logger) {
    if (logger != nullptr)
      juce::Logger::setCurrentLogger(logger);
  }
  ~ScopedCurrentLogger() { juce::Logger::setCurrentLogger(nullptr); }
};

void runConversion(const juce::ArgumentList &args) {
  std::unique_ptr<juce::FileLogger> fileLogger;
  if (args.containsOption("--log-file"))
    fileLogger = std::make_unique<juce::FileLogger>(args.getFileForOption("--log-file"),
                                                    "Audio2Midi " AUDIO2MIDI_VERSION);
  ScopedCurrentLogger loggerScope(fileLogger.get());

  int errors = 0;
  try {
    const auto config = buildConfig(args);
    const auto files = collectInputFiles(args);

    ConsoleReporter reporter;
    ConversionWorker worker(files, config);
    worker.addListener(&reporter);
    worker.processAll();
    worker.removeListener(&reporter);
    errors = worker.getErrorCount();
  } catch (const InvalidInputError &e) {
    juce::ConsoleApplication::fail(e.what());
  }

  if (errors > 0)
    juce::ConsoleApplication::fail(juce::String(errors) + " file(s) failed to convert", 1);
}

} // namespace

int main(int argc, char *argv[]) {
  juce::ConsoleApplication app;

  app.addHelpCommand("--help|-h",
                     "Audio2Midi " AUDIO2MIDI_VERSION "\n"
                     "Usage: audio2midi [options] <audio files...>",
                     false);
  app.addVersionCommand("--version|-v", "Audio2Midi " AUDIO2MIDI_VERSION);

  app.addDefaultCommand(
      {"",
       "[options] <audio files...>",
       "Converts audio files to MIDI",
       "Options:\n"
       "  --config=<file>             JSON configuration file\n"
       "  --output-dir=<dir>          Where .mid files are written (default: next to "
       "the input)\n"
       "  --tempo=<bpm>               Tempo used when detection is off or fails\n"
       "  --no-tempo-detection        Use --tempo as is\n"
       "  --quantize=<grid>           quarter, eighth, sixteenth, thirty_second or none\n"
       "  --min-note-duration=<sec>   Shortest note kept\n"
       "  --ai                        Polyphonic transcription with AI models\n"
       "  --separate                  Source separation before transcription (implies "
       "--ai)\n"
       "  --preset=<name>             balanced, sensitive or conservative\n"
       "  --log-file=<file>           Write the log to a file",
       runConversion});

  return app.findAndRunCommand(argc, argv);
}
