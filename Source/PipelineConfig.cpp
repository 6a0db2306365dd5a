#include "PipelineConfig.h"
#include "Audio2MidiErrors.h"

namespace {

[[noreturn]] void badConfig(const juce::String &message) {
  throw InvalidInputError("bad configuration: " + message);
}

bool isNumber(const juce::var &v) {
  return v.isDouble() || v.isInt() || v.isInt64();
}

void readNumber(const juce::var &obj, const char *key, double &target) {
  if (!obj.hasProperty(key))
    return;
  const auto &v = obj[key];
  if (!isNumber(v))
    badConfig("'" + juce::String(key) + "' must be a number");
  target = (double)v;
}

void readInt(const juce::var &obj, const char *key, int &target) {
  if (!obj.hasProperty(key))
    return;
  const auto &v = obj[key];
  if (!isNumber(v))
    badConfig("'" + juce::String(key) + "' must be a number");
  target = (int)v;
}

void readBool(const juce::var &obj, const char *key, bool &target) {
  if (!obj.hasProperty(key))
    return;
  const auto &v = obj[key];
  if (!v.isBool())
    badConfig("'" + juce::String(key) + "' must be true or false");
  target = (bool)v;
}

void readString(const juce::var &obj, const char *key, juce::String &target) {
  if (!obj.hasProperty(key))
    return;
  const auto &v = obj[key];
  if (v.isString())
    target = v.toString();
  else if (isNumber(v))
    target = juce::String((double)v);
  else
    badConfig("'" + juce::String(key) + "' must be a string");
}

void readOptionalNumber(const juce::var &obj, const char *key,
                        std::optional<double> &target) {
  if (!obj.hasProperty(key))
    return;
  const auto &v = obj[key];
  if (v.isVoid() || v.isUndefined()) {
    target.reset();
    return;
  }
  if (!isNumber(v))
    badConfig("'" + juce::String(key) + "' must be a number or null");
  target = (double)v;
}

juce::var optionalToVar(const std::optional<double> &v) {
  return v.has_value() ? juce::var(*v) : juce::var();
}

double resolveFrequency(const juce::String &text, const char *which) {
  if (auto hz = NoteUtils::parseFrequency(text))
    return *hz;
  throw InvalidInputError("Invalid " + juce::String(which) + " '" + text +
                          "': expected a note name or a frequency in Hz");
}

} // namespace

double PipelineConfig::getFminHz() const { return resolveFrequency(fmin, "fmin"); }

double PipelineConfig::getFmaxHz() const { return resolveFrequency(fmax, "fmax"); }

juce::Result PipelineConfig::validate() const {
  const auto lo = NoteUtils::parseFrequency(fmin);
  const auto hi = NoteUtils::parseFrequency(fmax);
  if (!lo.has_value())
    return juce::Result::fail("fmin '" + fmin + "' is not a note name or frequency");
  if (!hi.has_value())
    return juce::Result::fail("fmax '" + fmax + "' is not a note name or frequency");
  if (*lo >= *hi)
    return juce::Result::fail("fmin must be lower than fmax");

  if (hopLength <= 0)
    return juce::Result::fail("hop_length must be positive");
  if (frameLength < 64)
    return juce::Result::fail("frame_length must be at least 64");
  if (!(tempo > 0.0))
    return juce::Result::fail("tempo must be positive");
  if (minNoteDuration < 0.0)
    return juce::Result::fail("min_note_duration must not be negative");

  if (filter.minConfidence < 0.0 || filter.minConfidence > 1.0)
    return juce::Result::fail("filter.min_confidence must be within 0..1");
  if (filter.minDuration < 0.0 || filter.maxDuration < filter.minDuration)
    return juce::Result::fail("filter durations must satisfy 0 <= min <= max");
  if (filter.minVelocity < 0 || filter.maxVelocity > 127 ||
      filter.minVelocity > filter.maxVelocity)
    return juce::Result::fail("filter velocities must satisfy 0 <= min <= max <= 127");
  if (!(filter.outlierStdThreshold > 0.0))
    return juce::Result::fail("filter.outlier_std_threshold must be positive");

  if (transcription.onsetThreshold < 0.0 || transcription.onsetThreshold > 1.0 ||
      transcription.frameThreshold < 0.0 || transcription.frameThreshold > 1.0)
    return juce::Result::fail("transcription thresholds must be within 0..1");
  if (transcription.minimumNoteLength < 0.0)
    return juce::Result::fail("transcription minimum_note_length must not be negative");

  if (enableSeparation && !useAiModels)
    return juce::Result::fail("enable_separation requires use_ai_models");

  return juce::Result::ok();
}

juce::var PipelineConfig::toVar() const {
  auto *filterObj = new juce::DynamicObject();
  filterObj->setProperty("min_confidence", filter.minConfidence);
  filterObj->setProperty("min_duration", filter.minDuration);
  filterObj->setProperty("max_duration", filter.maxDuration);
  filterObj->setProperty("min_velocity", filter.minVelocity);
  filterObj->setProperty("max_velocity", filter.maxVelocity);
  filterObj->setProperty("remove_outliers", filter.removeOutliers);
  filterObj->setProperty("outlier_std_threshold", filter.outlierStdThreshold);

  auto *obj = new juce::DynamicObject();
  obj->setProperty("fmin", fmin);
  obj->setProperty("fmax", fmax);
  obj->setProperty("hop_length", hopLength);
  obj->setProperty("frame_length", frameLength);
  obj->setProperty("tempo", tempo);
  obj->setProperty("min_note_duration", minNoteDuration);
  obj->setProperty("detect_tempo", detectTempo);
  obj->setProperty("quantization_enabled", quantizationEnabled);
  obj->setProperty("quantization_grid", NoteQuantizer::gridName(quantizationGrid));
  obj->setProperty("filter", juce::var(filterObj));
  obj->setProperty("use_ai_models", useAiModels);
  obj->setProperty("enable_separation", enableSeparation);
  obj->setProperty("demucs_model", separationModel);
  obj->setProperty("device", device);
  obj->setProperty("models_cache_dir", modelsCacheDir.getFullPathName());
  obj->setProperty("sensitivity_preset", sensitivityPreset);
  obj->setProperty("basic_pitch", transcription.toVar());
  obj->setProperty("output_dir", outputDirectory.getFullPathName());
  return juce::var(obj);
}

PipelineConfig PipelineConfig::fromVar(const juce::var &json) {
  if (!json.isObject())
    badConfig("expected a JSON object");

  PipelineConfig config;

  readString(json, "fmin", config.fmin);
  readString(json, "fmax", config.fmax);
  readInt(json, "hop_length", config.hopLength);
  readInt(json, "frame_length", config.frameLength);
  readNumber(json, "tempo", config.tempo);
  readNumber(json, "min_note_duration", config.minNoteDuration);
  readBool(json, "detect_tempo", config.detectTempo);
  readBool(json, "quantization_enabled", config.quantizationEnabled);

  if (json.hasProperty("quantization_grid")) {
    const auto name = json["quantization_grid"].toString();
    const auto grid = NoteQuantizer::gridFromName(name);
    if (!grid.has_value())
      badConfig("unknown quantization_grid '" + name + "'");
    config.quantizationGrid = *grid;
  }

  if (json.hasProperty("filter")) {
    const auto &f = json["filter"];
    if (!f.isObject())
      badConfig("'filter' must be an object");
    readNumber(f, "min_confidence", config.filter.minConfidence);
    readNumber(f, "min_duration", config.filter.minDuration);
    readNumber(f, "max_duration", config.filter.maxDuration);
    readInt(f, "min_velocity", config.filter.minVelocity);
    readInt(f, "max_velocity", config.filter.maxVelocity);
    readBool(f, "remove_outliers", config.filter.removeOutliers);
    readNumber(f, "outlier_std_threshold", config.filter.outlierStdThreshold);
  }

  readBool(json, "use_ai_models", config.useAiModels);
  readBool(json, "enable_separation", config.enableSeparation);
  readString(json, "demucs_model", config.separationModel);
  readString(json, "device", config.device);

  juce::String path;
  readString(json, "models_cache_dir", path);
  if (path.isNotEmpty())
    config.modelsCacheDir = juce::File::getCurrentWorkingDirectory().getChildFile(path);

  // The preset sets the baseline, explicit basic_pitch values refine it.
  readString(json, "sensitivity_preset", config.sensitivityPreset);
  config.transcription = TranscriptionSettings::fromPreset(config.sensitivityPreset);

  if (json.hasProperty("basic_pitch")) {
    const auto &bp = json["basic_pitch"];
    if (!bp.isObject())
      badConfig("'basic_pitch' must be an object");
    readNumber(bp, "onset_threshold", config.transcription.onsetThreshold);
    readNumber(bp, "frame_threshold", config.transcription.frameThreshold);
    readNumber(bp, "minimum_note_length", config.transcription.minimumNoteLength);
    readOptionalNumber(bp, "minimum_frequency", config.transcription.minimumFrequency);
    readOptionalNumber(bp, "maximum_frequency", config.transcription.maximumFrequency);
    readString(bp, "model_path", config.transcription.modelPath);
  }

  path = {};
  readString(json, "output_dir", path);
  if (path.isNotEmpty())
    config.outputDirectory = juce::File::getCurrentWorkingDirectory().getChildFile(path);

  const auto check = config.validate();
  if (check.failed())
    badConfig(check.getErrorMessage());

  return config;
}

PipelineConfig PipelineConfig::loadFromFile(const juce::File &file) {
  if (!file.existsAsFile())
    throw InvalidInputError("Configuration file not found: " + file.getFullPathName());

  juce::var json;
  const auto parsed = juce::JSON::parse(file.loadFileAsString(), json);
  if (parsed.failed())
    badConfig(file.getFileName() + ": " + parsed.getErrorMessage());

  return fromVar(json);
}

juce::Result PipelineConfig::saveToFile(const juce::File &file) const {
  if (!file.replaceWithText(juce::JSON::toString(toVar())))
    return juce::Result::fail("Could not write " + file.getFullPathName());
  return juce::Result::ok();
}
