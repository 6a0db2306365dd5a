#pragma once

#include "NoteTypes.h"
#include "OnsetDetector.h"
#include <juce_dsp/juce_dsp.h>
#include <vector>

/**
 * PitchDetector
 *
 * Monophonic pitch tracking (YIN with a voicing threshold) and segmentation
 * of the resulting pitch track into notes at onset boundaries.
 *
 * Multi-channel input is averaged to mono. Frames are centred on multiples of
 * the hop length and zero padded at both ends, so the first frame is at 0 s.
 */
class PitchDetector {
public:
  PitchDetector(double fminHz = defaultFmin(), double fmaxHz = defaultFmax(),
                int hopLength = 512, int frameLength = 2048);

  static double defaultFmin(); // C2
  static double defaultFmax(); // C7

  /** Throws InvalidInputError when the audio is empty. */
  std::vector<PitchFrame> detectPitch(const AudioData &audio) const;

  /**
   * Splits the pitch track into notes between consecutive onsets.
   *
   * Spans shorter than minNoteDuration are dropped, apart from the last one.
   * Spans without a voiced frame produce no note.
   */
  std::vector<NoteEvent> segmentNotes(const std::vector<PitchFrame> &frames,
                                      const AudioData &audio,
                                      double minNoteDuration = 0.05) const;

  struct Span {
    double startTime = 0.0;
    double endTime = 0.0;
  };

  /**
   * Pairs consecutive boundaries into spans. Spans shorter than
   * minNoteDuration are dropped, except the last, which is stretched to
   * reach duration and kept however short it is.
   */
  static std::vector<Span> noteSpans(const std::vector<double> &boundaries,
                                     double duration, double minNoteDuration);

  /**
   * Velocity from the RMS of the first 30 ms blended with the RMS of the
   * whole segment, mapped into 40..110. Silent or empty segments give 64.
   */
  static int computeVelocity(const std::vector<float> &mono, double sampleRate,
                             double startTime, double endTime,
                             double onsetWeight = 0.7);

  double getFmin() const { return fmin; }
  double getFmax() const { return fmax; }
  int getHopLength() const { return hopLength; }
  int getFrameLength() const { return frameLength; }

private:
  struct YinEstimate {
    double frequency = 0.0;
    double aperiodicity = 1.0;
    bool belowThreshold = false;
  };

  YinEstimate yinPitch(const std::vector<float> &frame, double sampleRate,
                       juce::dsp::FFT &fft,
                       std::vector<juce::dsp::Complex<float>> &scratchA,
                       std::vector<juce::dsp::Complex<float>> &scratchB) const;

  /** Returns the boundary times used to split the audio into spans. */
  std::vector<double> noteBoundaries(const std::vector<float> &mono,
                                     double sampleRate, double firstFrameTime,
                                     double duration) const;

  double fmin;
  double fmax;
  int hopLength;
  int frameLength;
  OnsetDetector onsetDetector;

  static constexpr double yinThreshold = 0.15;
  static constexpr double silenceRms = 1.0e-3;
};
