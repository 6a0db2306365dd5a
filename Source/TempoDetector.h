#pragma once

#include "NoteTypes.h"
#include "OnsetDetector.h"
#include <vector>

/**
 * TempoDetector
 *
 * Estimates one BPM value and the beat positions from the onset envelope.
 * Tempo candidates come from the autocorrelation of overlapping envelope
 * windows weighted by a log-normal prior around the start BPM; beats are then
 * placed by dynamic programming at that period.
 *
 * Time signature detection is not attempted, results always report 4/4.
 */
class TempoDetector {
public:
  explicit TempoDetector(bool aggregateTempo = true, double startBpm = 120.0,
                         int hopLength = 512);

  /**
   * Throws InvalidInputError on empty audio and TempoDetectionError when the
   * signal has no rhythmic content to track.
   */
  TempoInfo detectTempo(const AudioData &audio) const;

  /** Mean of the per-window tempo curve; isConstant is false. */
  TempoInfo detectTimeVaryingTempo(const AudioData &audio) const;

  /** One tempo estimate per analysis window. */
  std::vector<double> getTempoCurve(const AudioData &audio) const;

  /**
   * Confidence from beat regularity: 1 - (std / mean) of the inter-beat
   * intervals, halved below 0.3, clamped to 0..1. Fewer than two beats is 0.
   */
  static double estimateConfidence(const std::vector<double> &beatTimes);

  /** Beat frames for an onset envelope at a fixed tempo. */
  static std::vector<int> trackBeats(const std::vector<float> &envelope,
                                     double bpm, double framesPerSecond,
                                     double tightness = 100.0);

  double getStartBpm() const { return startBpm; }

private:
  std::vector<float> prepareEnvelope(const AudioData &audio) const;
  std::vector<double> tempoCandidates(const std::vector<float> &envelope,
                                      double framesPerSecond) const;
  double estimateWindowTempo(const std::vector<float> &envelope, int start,
                             int length, double framesPerSecond) const;

  bool aggregateTempo;
  double startBpm;
  int hopLength;
  OnsetDetector onsetDetector;

  static constexpr double minBpm = 30.0;
  static constexpr double maxBpm = 320.0;
  static constexpr double windowSeconds = 8.0;
};
