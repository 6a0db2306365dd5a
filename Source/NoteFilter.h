#pragma once

#include "NoteTypes.h"
#include <vector>

/** Thresholds for NoteFilter. Bounds are inclusive. */
struct FilterConfig {
  double minConfidence = 0.3;
  double minDuration = 0.05;  // seconds
  double maxDuration = 10.0;  // seconds
  int minVelocity = 20;
  int maxVelocity = 127;
  bool removeOutliers = true;
  double outlierStdThreshold = 3.0;
};

/**
 * NoteFilter
 *
 * Drops notes that fail the confidence, duration and velocity checks, in that
 * order, then optionally removes pitch outliers by z-score over what is left.
 * The input list is never touched.
 */
class NoteFilter {
public:
  struct FilterResult {
    std::vector<NoteEvent> notes;
    int removedCount = 0;
  };

  struct FilterStatistics {
    int originalCount = 0;
    int filteredCount = 0;
    int removedCount = 0;
    double removalPercentage = 0.0;
    double retentionPercentage = 0.0;
  };

  explicit NoteFilter(FilterConfig config = {});

  FilterResult filterNotes(const std::vector<NoteEvent> &notes) const;

  /** Outlier pass on its own. Needs at least three notes to do anything. */
  std::vector<NoteEvent>
  removePitchOutliers(const std::vector<NoteEvent> &notes) const;

  static FilterStatistics
  getFilterStatistics(const std::vector<NoteEvent> &original,
                      const std::vector<NoteEvent> &filtered);

  const FilterConfig &getConfig() const { return config; }
  void setConfig(const FilterConfig &newConfig) { config = newConfig; }

private:
  bool passesThresholds(const NoteEvent &note) const;

  FilterConfig config;
};
