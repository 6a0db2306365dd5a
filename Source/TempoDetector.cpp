#include "TempoDetector.h"
#include "Audio2MidiErrors.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

TempoDetector::TempoDetector(bool aggregate, double bpm, int hop)
    : aggregateTempo(aggregate), startBpm(bpm), hopLength(hop),
      onsetDetector(hop) {
  if (!(startBpm > 0.0))
    throw InvalidInputError("Start BPM must be positive");
}

std::vector<float> TempoDetector::prepareEnvelope(const AudioData &audio) const {
  if (audio.isEmpty())
    throw InvalidInputError("Audio data is empty");
  if (audio.sampleRate <= 0.0)
    throw InvalidInputError("Audio sample rate must be positive");

  auto envelope =
      onsetDetector.computeOnsetEnvelope(audio.toMono(), audio.sampleRate);

  if (envelope.size() < 4)
    throw TempoDetectionError("Audio is too short for tempo estimation");

  if (*std::max_element(envelope.begin(), envelope.end()) <= 0.0f)
    throw TempoDetectionError("No onsets found, cannot track beats");

  return envelope;
}

// ---------------------------------------------------------------------------
// Tempo estimation
// ---------------------------------------------------------------------------

double TempoDetector::estimateWindowTempo(const std::vector<float> &envelope,
                                          int start, int length,
                                          double framesPerSecond) const {
  std::vector<double> x((size_t)length);
  for (int i = 0; i < length; ++i) {
    const double hann =
        length > 1 ? 0.5 - 0.5 * std::cos(2.0 * juce::MathConstants<double>::pi *
                                          i / (length - 1))
                   : 1.0;
    x[(size_t)i] = envelope[(size_t)(start + i)] * hann;
  }

  double ac0 = 0.0;
  for (double v : x)
    ac0 += v * v;
  if (ac0 <= 0.0)
    return 0.0;

  const double logStart = std::log2(startBpm);
  double bestScore = -std::numeric_limits<double>::infinity();
  double bestBpm = 0.0;

  for (int lag = 1; lag < length; ++lag) {
    const double bpm = 60.0 * framesPerSecond / lag;
    if (bpm < minBpm || bpm > maxBpm)
      continue;

    double ac = 0.0;
    for (int i = 0; i + lag < length; ++i)
      ac += x[(size_t)i] * x[(size_t)(i + lag)];

    const double logPrior = -0.5 * std::pow(std::log2(bpm) - logStart, 2.0);
    const double score = std::log1p(1.0e6 * juce::jmax(0.0, ac / ac0)) + logPrior;

    if (score > bestScore) {
      bestScore = score;
      bestBpm = bpm;
    }
  }

  return bestBpm;
}

std::vector<double>
TempoDetector::tempoCandidates(const std::vector<float> &envelope,
                               double framesPerSecond) const {
  const int total = (int)envelope.size();
  const int windowLength =
      juce::jmin(total, (int)std::lround(windowSeconds * framesPerSecond));
  const int windowHop = juce::jmax(1, windowLength / 4);

  std::vector<double> candidates;
  for (int start = 0; start + windowLength <= total; start += windowHop) {
    const double bpm =
        estimateWindowTempo(envelope, start, windowLength, framesPerSecond);
    if (bpm > 0.0)
      candidates.push_back(bpm);
  }

  if (candidates.empty())
    throw TempoDetectionError("No periodicity found in the onset envelope");

  return candidates;
}

std::vector<double> TempoDetector::getTempoCurve(const AudioData &audio) const {
  const auto envelope = prepareEnvelope(audio);
  return tempoCandidates(envelope, audio.sampleRate / hopLength);
}

// ---------------------------------------------------------------------------
// Beat tracking
// ---------------------------------------------------------------------------

std::vector<int> TempoDetector::trackBeats(const std::vector<float> &envelope,
                                           double bpm, double framesPerSecond,
                                           double tightness) {
  const int n = (int)envelope.size();
  if (n == 0 || !(bpm > 0.0))
    return {};

  const int period = juce::jmax(1, (int)std::lround(60.0 * framesPerSecond / bpm));

  // Normalise by the standard deviation so tightness means the same thing
  // for loud and quiet material.
  const double mean =
      std::accumulate(envelope.begin(), envelope.end(), 0.0) / n;
  double variance = 0.0;
  for (float v : envelope)
    variance += (v - mean) * (v - mean);
  const double stdDev = n > 1 ? std::sqrt(variance / (n - 1)) : 0.0;

  std::vector<double> onset((size_t)n);
  for (int i = 0; i < n; ++i)
    onset[(size_t)i] = stdDev > 0.0 ? envelope[(size_t)i] / stdDev : envelope[(size_t)i];

  std::vector<double> localScore((size_t)n, 0.0);
  for (int i = 0; i < n; ++i) {
    double sum = 0.0;
    for (int k = -period; k <= period; ++k) {
      const int j = i + k;
      if (j < 0 || j >= n)
        continue;
      const double w = (double)k * 32.0 / period;
      sum += onset[(size_t)j] * std::exp(-0.5 * w * w);
    }
    localScore[(size_t)i] = sum;
  }

  const double maxLocal = *std::max_element(localScore.begin(), localScore.end());

  const int searchStart = -2 * period;
  const int searchEnd = -juce::jmax(1, (int)std::lround(period / 2.0));

  std::vector<double> cumScore((size_t)n, 0.0);
  std::vector<int> backlink((size_t)n, -1);
  bool firstBeat = true;

  for (int i = 0; i < n; ++i) {
    double best = -std::numeric_limits<double>::infinity();
    int bestIndex = -1;

    for (int offset = searchStart; offset <= searchEnd; ++offset) {
      const int j = i + offset;
      if (j < 0)
        continue;
      const double logRatio = std::log((double)-offset / period);
      const double score = cumScore[(size_t)j] - tightness * logRatio * logRatio;
      if (score > best) {
        best = score;
        bestIndex = j;
      }
    }

    cumScore[(size_t)i] = localScore[(size_t)i] + (bestIndex >= 0 ? best : 0.0);

    if (firstBeat && localScore[(size_t)i] < 0.01 * maxLocal) {
      backlink[(size_t)i] = -1;
    } else {
      backlink[(size_t)i] = bestIndex;
      firstBeat = false;
    }
  }

  // The last beat is the latest local maximum of the cumulative score that
  // reaches half the median peak height.
  std::vector<int> peaks;
  for (int i = 0; i < n; ++i) {
    const bool risesIn = i == 0 || cumScore[(size_t)i] > cumScore[(size_t)i - 1];
    const bool fallsOut = i == n - 1 || cumScore[(size_t)i] >= cumScore[(size_t)i + 1];
    if (risesIn && fallsOut)
      peaks.push_back(i);
  }

  int lastBeat = (int)(std::max_element(cumScore.begin(), cumScore.end()) - cumScore.begin());
  if (!peaks.empty()) {
    std::vector<double> peakScores;
    for (int p : peaks)
      peakScores.push_back(cumScore[(size_t)p]);
    std::sort(peakScores.begin(), peakScores.end());
    const double medianPeak = peakScores[peakScores.size() / 2];
    for (int p : peaks)
      if (cumScore[(size_t)p] >= 0.5 * medianPeak)
        lastBeat = p;
  }

  std::vector<int> beats{lastBeat};
  while (backlink[(size_t)beats.back()] >= 0)
    beats.push_back(backlink[(size_t)beats.back()]);
  std::reverse(beats.begin(), beats.end());

  // Trim weak beats from both ends.
  double energy = 0.0;
  for (int b : beats)
    energy += localScore[(size_t)b] * localScore[(size_t)b];
  const double threshold = 0.5 * std::sqrt(energy / (double)beats.size());

  auto first = beats.begin();
  auto last = beats.end();
  while (first != last && localScore[(size_t)*first] <= threshold)
    ++first;
  while (last != first && localScore[(size_t)*(last - 1)] <= threshold)
    --last;

  return std::vector<int>(first, last);
}

double TempoDetector::estimateConfidence(const std::vector<double> &beatTimes) {
  if (beatTimes.size() < 2)
    return 0.0;

  std::vector<double> intervals;
  for (size_t i = 1; i < beatTimes.size(); ++i)
    intervals.push_back(beatTimes[i] - beatTimes[i - 1]);

  const double mean =
      std::accumulate(intervals.begin(), intervals.end(), 0.0) / intervals.size();
  if (mean == 0.0)
    return 0.0;

  double variance = 0.0;
  for (double v : intervals)
    variance += (v - mean) * (v - mean);
  const double stdDev = std::sqrt(variance / intervals.size());

  double confidence = juce::jmax(0.0, 1.0 - stdDev / mean);

  // Highly irregular beats are penalised further.
  if (confidence < 0.3)
    confidence *= 0.5;

  return juce::jlimit(0.0, 1.0, confidence);
}

// ---------------------------------------------------------------------------
// Public entry points
// ---------------------------------------------------------------------------

TempoInfo TempoDetector::detectTempo(const AudioData &audio) const {
  const auto envelope = prepareEnvelope(audio);
  const double framesPerSecond = audio.sampleRate / hopLength;
  auto candidates = tempoCandidates(envelope, framesPerSecond);

  double tempo = candidates.front();
  if (aggregateTempo && candidates.size() > 1) {
    std::sort(candidates.begin(), candidates.end());
    const size_t mid = candidates.size() / 2;
    tempo = candidates.size() % 2 == 1
                ? candidates[mid]
                : 0.5 * (candidates[mid - 1] + candidates[mid]);
  }

  TempoInfo info;
  info.tempoBpm = tempo;
  for (int frame : trackBeats(envelope, tempo, framesPerSecond))
    info.beatTimes.push_back(frame / framesPerSecond);
  info.confidence = estimateConfidence(info.beatTimes);
  info.isConstant = aggregateTempo;

  juce::Logger::writeToLog("Detected tempo: " + juce::String(tempo, 1) +
                           " BPM, beats: " + juce::String((int)info.beatTimes.size()) +
                           ", confidence: " + juce::String(info.confidence, 2));
  return info;
}

TempoInfo TempoDetector::detectTimeVaryingTempo(const AudioData &audio) const {
  const auto envelope = prepareEnvelope(audio);
  const double framesPerSecond = audio.sampleRate / hopLength;
  const auto curve = tempoCandidates(envelope, framesPerSecond);

  TempoInfo info;
  info.tempoBpm = std::accumulate(curve.begin(), curve.end(), 0.0) / curve.size();
  for (int frame : trackBeats(envelope, info.tempoBpm, framesPerSecond))
    info.beatTimes.push_back(frame / framesPerSecond);
  info.confidence = estimateConfidence(info.beatTimes);
  info.isConstant = false;
  return info;
}
