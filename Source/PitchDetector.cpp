#include "PitchDetector.h"
#include "Audio2MidiErrors.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace {

int fftOrderFor(int minimumSize) {
  int order = 1;
  while ((1 << order) < minimumSize)
    ++order;
  return order;
}

double frameRms(const std::vector<float> &frame) {
  double sum = 0.0;
  for (float s : frame)
    sum += (double)s * s;
  return frame.empty() ? 0.0 : std::sqrt(sum / (double)frame.size());
}

// Mean of framewise RMS values across a block of samples.
double meanFrameRms(const float *data, int numSamples, int frameLen, int hop) {
  if (numSamples <= 0)
    return 0.0;

  frameLen = juce::jlimit(1, numSamples, frameLen);
  hop = juce::jmax(1, hop);

  double total = 0.0;
  int frames = 0;
  for (int start = 0; start < numSamples; start += hop) {
    const int end = juce::jmin(numSamples, start + frameLen);
    double sum = 0.0;
    for (int i = start; i < end; ++i)
      sum += (double)data[i] * data[i];
    total += std::sqrt(sum / (double)(end - start));
    ++frames;
    if (end == numSamples)
      break;
  }
  return frames > 0 ? total / frames : 0.0;
}

double median(std::vector<double> values) {
  std::sort(values.begin(), values.end());
  const size_t n = values.size();
  return n % 2 == 1 ? values[n / 2] : 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

} // namespace

PitchDetector::PitchDetector(double fminHz, double fmaxHz, int hop, int frame)
    : fmin(fminHz), fmax(fmaxHz), hopLength(hop), frameLength(frame),
      onsetDetector(hop) {
  if (!(fmin > 0.0) || !(fmax > fmin))
    throw InvalidInputError("Pitch range must satisfy 0 < fmin < fmax");
  if (hopLength <= 0 || frameLength < 64)
    throw InvalidInputError("Hop length must be positive and frame length at "
                            "least 64 samples");
}

double PitchDetector::defaultFmin() {
  return NoteUtils::midiToHz(36.0); // C2
}

double PitchDetector::defaultFmax() {
  return NoteUtils::midiToHz(96.0); // C7
}

// ---------------------------------------------------------------------------
// Pitch tracking
// ---------------------------------------------------------------------------

PitchDetector::YinEstimate PitchDetector::yinPitch(
    const std::vector<float> &frame, double rate, juce::dsp::FFT &fft,
    std::vector<juce::dsp::Complex<float>> &scratchA,
    std::vector<juce::dsp::Complex<float>> &scratchB) const {
  YinEstimate estimate;
  const int n = (int)frame.size();
  const int minPeriod = juce::jmax(2, (int)std::floor(rate / fmax));
  const int maxPeriod = juce::jmin((int)std::ceil(rate / fmin), n / 2 - 1);
  if (maxPeriod <= minPeriod)
    return estimate;

  const int window = n - maxPeriod;
  const int fftSize = fft.getSize();

  // Cross-correlation of the integration window against the whole frame.
  std::vector<juce::dsp::Complex<float>> inA((size_t)fftSize), inB((size_t)fftSize);
  for (int i = 0; i < n; ++i)
    inA[(size_t)i] = {frame[(size_t)i], 0.0f};
  for (int i = 0; i < window; ++i)
    inB[(size_t)i] = {frame[(size_t)i], 0.0f};

  fft.perform(inA.data(), scratchA.data(), false);
  fft.perform(inB.data(), scratchB.data(), false);
  for (int k = 0; k < fftSize; ++k)
    scratchA[(size_t)k] *= std::conj(scratchB[(size_t)k]);
  fft.perform(scratchA.data(), scratchB.data(), true);

  std::vector<double> squares((size_t)n + 1, 0.0);
  for (int i = 0; i < n; ++i)
    squares[(size_t)i + 1] = squares[(size_t)i] + (double)frame[(size_t)i] * frame[(size_t)i];

  const double energy0 = squares[(size_t)window];

  // Step 1 + 2: difference function and cumulative mean normalisation
  std::vector<double> yinBuffer((size_t)maxPeriod + 2, 1.0);
  double runningSum = 0.0;
  for (int tau = 1; tau <= maxPeriod; ++tau) {
    const double energyTau = squares[(size_t)(tau + window)] - squares[(size_t)tau];
    const double diff = juce::jmax(
        0.0, energy0 + energyTau - 2.0 * (double)scratchB[(size_t)tau].real());
    runningSum += diff;
    yinBuffer[(size_t)tau] = runningSum > 0.0 ? diff * tau / runningSum : 1.0;
  }

  // Step 3: absolute threshold
  int tauEstimate = -1;
  for (int tau = minPeriod; tau <= maxPeriod; ++tau) {
    if (yinBuffer[(size_t)tau] < yinThreshold) {
      while (tau + 1 <= maxPeriod &&
             yinBuffer[(size_t)tau + 1] < yinBuffer[(size_t)tau])
        ++tau;
      tauEstimate = tau;
      estimate.belowThreshold = true;
      break;
    }
  }

  if (tauEstimate == -1) {
    // No dip under the threshold: keep the global minimum for the confidence.
    tauEstimate = minPeriod;
    for (int tau = minPeriod + 1; tau <= maxPeriod; ++tau)
      if (yinBuffer[(size_t)tau] < yinBuffer[(size_t)tauEstimate])
        tauEstimate = tau;
  }

  estimate.aperiodicity = yinBuffer[(size_t)tauEstimate];

  // Step 4: parabolic interpolation
  double betterTau = tauEstimate;
  if (tauEstimate > 1 && tauEstimate < maxPeriod) {
    const double s0 = yinBuffer[(size_t)tauEstimate - 1];
    const double s1 = yinBuffer[(size_t)tauEstimate];
    const double s2 = yinBuffer[(size_t)tauEstimate + 1];
    const double denom = 2.0 * (2.0 * s1 - s2 - s0);
    if (std::abs(denom) > 1.0e-12)
      betterTau += (s2 - s0) / denom;
  }

  if (betterTau > 0.0)
    estimate.frequency = rate / betterTau;

  return estimate;
}

std::vector<PitchFrame> PitchDetector::detectPitch(const AudioData &audio) const {
  if (audio.isEmpty())
    throw InvalidInputError("Audio data is empty");
  if (audio.sampleRate <= 0.0)
    throw InvalidInputError("Audio sample rate must be positive");

  const auto mono = audio.toMono();
  const int numSamples = (int)mono.size();
  const int numFrames = 1 + numSamples / hopLength;

  juce::dsp::FFT fft(fftOrderFor(frameLength * 2));
  std::vector<juce::dsp::Complex<float>> scratchA((size_t)fft.getSize());
  std::vector<juce::dsp::Complex<float>> scratchB((size_t)fft.getSize());
  std::vector<float> frame((size_t)frameLength, 0.0f);

  std::vector<PitchFrame> frames;
  frames.reserve((size_t)numFrames);

  for (int f = 0; f < numFrames; ++f) {
    const int first = f * hopLength - frameLength / 2;
    for (int j = 0; j < frameLength; ++j) {
      const int idx = first + j;
      frame[(size_t)j] = (idx >= 0 && idx < numSamples) ? mono[(size_t)idx] : 0.0f;
    }

    PitchFrame pf;
    pf.time = (double)f * hopLength / audio.sampleRate;

    // Silence gate: nothing to track in an empty frame.
    if (frameRms(frame) >= silenceRms) {
      const auto estimate = yinPitch(frame, audio.sampleRate, fft, scratchA, scratchB);
      pf.confidence = juce::jlimit(0.0, 1.0, 1.0 - estimate.aperiodicity);

      const bool inRange = estimate.frequency >= fmin && estimate.frequency <= fmax;
      if (estimate.belowThreshold && inRange) {
        pf.voiced = true;
        pf.frequency = estimate.frequency;
      }
    }

    frames.push_back(pf);
  }

  return frames;
}

// ---------------------------------------------------------------------------
// Segmentation
// ---------------------------------------------------------------------------

std::vector<double> PitchDetector::noteBoundaries(const std::vector<float> &mono,
                                                  double sampleRate,
                                                  double firstFrameTime,
                                                  double duration) const {
  auto boundaries = onsetDetector.detectOnsetTimes(mono, sampleRate, true);

  if (boundaries.empty() || boundaries.front() > firstFrameTime)
    boundaries.insert(boundaries.begin(), firstFrameTime);

  // Small tolerance so a boundary sitting on the last sample is not doubled.
  if (boundaries.back() < duration - 0.01)
    boundaries.push_back(duration);

  return boundaries;
}

std::vector<PitchDetector::Span>
PitchDetector::noteSpans(const std::vector<double> &boundaries, double duration,
                         double minNoteDuration) {
  std::vector<Span> spans;
  const int numSpans = (int)boundaries.size() - 1;

  for (int i = 0; i < numSpans; ++i) {
    const bool lastSpan = i == numSpans - 1;
    Span span{boundaries[(size_t)i], boundaries[(size_t)i + 1]};
    if (lastSpan)
      span.endTime = juce::jmax(span.endTime, duration);

    // The final span survives however short it is, so trailing notes stay.
    if (span.endTime - span.startTime < minNoteDuration && !lastSpan)
      continue;

    spans.push_back(span);
  }
  return spans;
}

std::vector<NoteEvent>
PitchDetector::segmentNotes(const std::vector<PitchFrame> &frames,
                            const AudioData &audio,
                            double minNoteDuration) const {
  std::vector<NoteEvent> notes;
  if (frames.empty() || audio.isEmpty())
    return notes;

  const auto mono = audio.toMono();
  const double duration = audio.getDurationSeconds();
  const auto boundaries =
      noteBoundaries(mono, audio.sampleRate, frames.front().time, duration);

  for (const auto &span : noteSpans(boundaries, duration, minNoteDuration)) {
    const double startTime = span.startTime;
    const double endTime = span.endTime;

    std::vector<double> freqs;
    double confidenceSum = 0.0;
    for (const auto &f : frames) {
      if (f.time < startTime || f.time >= endTime)
        continue;
      if (f.voiced && f.frequency.has_value()) {
        freqs.push_back(*f.frequency);
        confidenceSum += f.confidence;
      }
    }

    if (freqs.empty())
      continue;

    NoteEvent note;
    note.startTime = startTime;
    note.endTime = endTime;
    note.pitchHz = median(freqs);
    note.midiNote = NoteUtils::clampMidiNote(NoteUtils::hzToMidi(note.pitchHz));
    note.confidence = confidenceSum / (double)freqs.size();
    note.velocity = computeVelocity(mono, audio.sampleRate, startTime, endTime);

    if (note.endTime > note.startTime)
      notes.push_back(note);
  }

  return notes;
}

// ---------------------------------------------------------------------------
// Velocity
// ---------------------------------------------------------------------------

int PitchDetector::computeVelocity(const std::vector<float> &mono,
                                   double sampleRate, double startTime,
                                   double endTime, double onsetWeight) {
  constexpr int mezzoForte = 64;
  const int total = (int)mono.size();
  if (total == 0 || sampleRate <= 0.0 || !(endTime > startTime))
    return mezzoForte;

  int startSample = (int)(startTime * sampleRate);
  int endSample = (int)(endTime * sampleRate);
  startSample = juce::jlimit(0, total - 1, startSample);
  endSample = juce::jlimit(startSample + 1, total, endSample);

  const float *segment = mono.data() + startSample;
  const int segmentLength = endSample - startSample;

  // Attack window: first 30 ms, or the whole segment when it is shorter.
  const int onsetLength = juce::jmin(segmentLength, (int)(0.03 * sampleRate));

  const int fullFrame = juce::jmin(2048, segmentLength);
  const double sustainRms = meanFrameRms(segment, segmentLength, fullFrame,
                                         juce::jmax(1, fullFrame / 4));

  const int onsetFrame = juce::jmin(512, onsetLength);
  const double onsetRms =
      onsetLength > 0
          ? meanFrameRms(segment, onsetLength, onsetFrame,
                         juce::jmax(1, juce::jmin(128, onsetLength / 4)))
          : 0.0;

  const double weightedRms =
      onsetWeight * onsetRms + (1.0 - onsetWeight) * sustainRms;

  if (!(weightedRms > 0.0))
    return mezzoForte;

  const double compressed = std::tanh(weightedRms * 2.0) * 0.5;
  const double velocity = 40.0 + 70.0 * std::pow(compressed, 0.4);
  return (int)juce::jlimit(40.0, 110.0, velocity);
}
