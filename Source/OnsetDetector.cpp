#include "OnsetDetector.h"
#include <algorithm>
#include <cmath>
#include <iterator>

OnsetDetector::OnsetDetector(int hop, int order)
    : hopLength(juce::jmax(1, hop)), fftOrder(order), fftSize(1 << order) {}

std::vector<float>
OnsetDetector::computeOnsetEnvelope(const std::vector<float> &mono,
                                    double sampleRate) const {
  juce::ignoreUnused(sampleRate);
  std::vector<float> envelope;
  if (mono.empty())
    return envelope;

  const int numSamples = (int)mono.size();
  const int numFrames = 1 + numSamples / hopLength;
  const int numBins = fftSize / 2 + 1;

  juce::dsp::FFT fft(fftOrder);
  juce::dsp::WindowingFunction<float> window(
      (size_t)fftSize, juce::dsp::WindowingFunction<float>::hann, false);

  std::vector<float> fftData((size_t)fftSize * 2, 0.0f);
  std::vector<float> previous((size_t)numBins, 0.0f);
  std::vector<float> current((size_t)numBins, 0.0f);

  // Log magnitudes are floored 80 dB below a full-scale hann-windowed sine.
  const float referenceDb = 20.0f * std::log10((float)fftSize / 4.0f);
  const float floorDb = referenceDb - 80.0f;

  envelope.assign((size_t)numFrames, 0.0f);

  for (int frame = 0; frame < numFrames; ++frame) {
    std::fill(fftData.begin(), fftData.end(), 0.0f);
    const int centre = frame * hopLength;
    const int first = centre - fftSize / 2;

    for (int j = 0; j < fftSize; ++j) {
      const int idx = first + j;
      if (idx >= 0 && idx < numSamples)
        fftData[(size_t)j] = mono[(size_t)idx];
    }

    window.multiplyWithWindowingTable(fftData.data(), (size_t)fftSize);
    fft.performFrequencyOnlyForwardTransform(fftData.data());

    for (int k = 0; k < numBins; ++k) {
      const float mag = juce::jmax(fftData[(size_t)k], 1.0e-10f);
      current[(size_t)k] = juce::jmax(20.0f * std::log10(mag), floorDb);
    }

    if (frame > 0) {
      double flux = 0.0;
      for (int k = 0; k < numBins; ++k)
        flux += juce::jmax(0.0f, current[(size_t)k] - previous[(size_t)k]);
      envelope[(size_t)frame] = (float)(flux / numBins);
    }

    std::swap(previous, current);
  }

  return envelope;
}

OnsetDetector::PeakPickParams
OnsetDetector::defaultPeakParams(double sampleRate) const {
  const double framesPerSecond = sampleRate / hopLength;
  PeakPickParams params;
  params.preMax = juce::jmax(1, (int)(0.03 * framesPerSecond));
  params.postMax = 1;
  params.preAvg = juce::jmax(1, (int)(0.10 * framesPerSecond));
  params.postAvg = (int)(0.10 * framesPerSecond) + 1;
  params.wait = (int)(0.03 * framesPerSecond);
  params.delta = 0.07f;
  return params;
}

void OnsetDetector::normalise(std::vector<float> &envelope) {
  if (envelope.empty())
    return;

  const auto range = std::minmax_element(envelope.begin(), envelope.end());
  const float lo = *range.first;
  const float span = *range.second - lo;

  for (auto &v : envelope)
    v = span > 0.0f ? (v - lo) / span : 0.0f;
}

std::vector<int> OnsetDetector::pickPeaks(const std::vector<float> &envelope,
                                          const PeakPickParams &params) {
  std::vector<int> peaks;
  const int n = (int)envelope.size();
  int lastPeak = -params.wait - 1;

  for (int i = 0; i < n; ++i) {
    const int maxStart = juce::jmax(0, i - params.preMax);
    const int maxEnd = juce::jmin(n, i + params.postMax);
    float localMax = envelope[(size_t)maxStart];
    for (int j = maxStart; j < maxEnd; ++j)
      localMax = juce::jmax(localMax, envelope[(size_t)j]);

    if (envelope[(size_t)i] != localMax)
      continue;

    const int avgStart = juce::jmax(0, i - params.preAvg);
    const int avgEnd = juce::jmin(n, i + params.postAvg);
    double sum = 0.0;
    for (int j = avgStart; j < avgEnd; ++j)
      sum += envelope[(size_t)j];
    const double mean = sum / juce::jmax(1, avgEnd - avgStart);

    if (envelope[(size_t)i] < mean + params.delta)
      continue;

    if (i - lastPeak > params.wait) {
      peaks.push_back(i);
      lastPeak = i;
    }
  }

  return peaks;
}

std::vector<int>
OnsetDetector::backtrackToMinima(const std::vector<int> &onsets,
                                 const std::vector<float> &energy) {
  // Frame 0 always counts as a minimum so every onset has somewhere to go.
  std::vector<int> minima{0};
  for (int i = 1; i + 1 < (int)energy.size(); ++i) {
    if (energy[(size_t)i] <= energy[(size_t)i - 1] &&
        energy[(size_t)i] < energy[(size_t)i + 1])
      minima.push_back(i);
  }

  std::vector<int> result;
  result.reserve(onsets.size());
  for (int onset : onsets) {
    auto it = std::upper_bound(minima.begin(), minima.end(), onset);
    result.push_back(it == minima.begin() ? 0 : *std::prev(it));
  }

  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

std::vector<int> OnsetDetector::detectOnsetFrames(const std::vector<float> &mono,
                                                  double sampleRate,
                                                  bool backtrack) const {
  auto envelope = computeOnsetEnvelope(mono, sampleRate);
  if (envelope.empty())
    return {};

  normalise(envelope);
  auto onsets = pickPeaks(envelope, defaultPeakParams(sampleRate));

  if (backtrack && !onsets.empty())
    onsets = backtrackToMinima(onsets, envelope);

  return onsets;
}

std::vector<double> OnsetDetector::detectOnsetTimes(const std::vector<float> &mono,
                                                    double sampleRate,
                                                    bool backtrack) const {
  std::vector<double> times;
  for (int frame : detectOnsetFrames(mono, sampleRate, backtrack))
    times.push_back(frameToTime(frame, sampleRate));
  return times;
}
