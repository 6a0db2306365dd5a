#pragma once

#include <juce_dsp/juce_dsp.h>
#include <vector>

/**
 * OnsetDetector
 *
 * Spectral-flux onset detection on a mono signal. The envelope has one value
 * per hop, with frames centred on multiples of the hop length, so frame k
 * sits at time k * hop / sampleRate.
 *
 * Onsets are picked as local maxima that stand above a moving average, then
 * optionally moved back to the preceding minimum of the envelope so that a
 * boundary lands where the note's energy starts rising.
 */
class OnsetDetector {
public:
  explicit OnsetDetector(int hopLength = 512, int fftOrder = 11);

  int getHopLength() const { return hopLength; }

  /** Positive spectral flux per frame, not normalised. */
  std::vector<float> computeOnsetEnvelope(const std::vector<float> &mono,
                                          double sampleRate) const;

  std::vector<int> detectOnsetFrames(const std::vector<float> &mono,
                                     double sampleRate,
                                     bool backtrack = true) const;

  std::vector<double> detectOnsetTimes(const std::vector<float> &mono,
                                       double sampleRate,
                                       bool backtrack = true) const;

  double frameToTime(int frame, double sampleRate) const {
    return (double)frame * hopLength / sampleRate;
  }

  struct PeakPickParams {
    int preMax = 2;
    int postMax = 1;
    int preAvg = 8;
    int postAvg = 9;
    float delta = 0.07f;
    int wait = 2;
  };

  /** Window sizes scaled to the sample rate (30 ms max, 100 ms mean). */
  PeakPickParams defaultPeakParams(double sampleRate) const;

  /** Envelope is expected to be normalised to 0..1. */
  static std::vector<int> pickPeaks(const std::vector<float> &envelope,
                                    const PeakPickParams &params);

  /** Moves every onset to the closest envelope minimum at or before it. */
  static std::vector<int> backtrackToMinima(const std::vector<int> &onsets,
                                            const std::vector<float> &energy);

  /** Scales to 0..1 in place; a flat envelope becomes all zeros. */
  static void normalise(std::vector<float> &envelope);

private:
  int hopLength;
  int fftOrder;
  int fftSize;
};
