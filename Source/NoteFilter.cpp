#include "NoteFilter.h"
#include <cmath>

NoteFilter::NoteFilter(FilterConfig c) : config(c) {}

bool NoteFilter::passesThresholds(const NoteEvent &note) const {
  if (note.confidence < config.minConfidence)
    return false;

  const double duration = note.getDuration();
  if (duration < config.minDuration || duration > config.maxDuration)
    return false;

  return note.velocity >= config.minVelocity &&
         note.velocity <= config.maxVelocity;
}

std::vector<NoteEvent>
NoteFilter::removePitchOutliers(const std::vector<NoteEvent> &notes) const {
  if (notes.size() < 3)
    return notes;

  double mean = 0.0;
  for (const auto &n : notes)
    mean += n.midiNote;
  mean /= (double)notes.size();

  double variance = 0.0;
  for (const auto &n : notes)
    variance += (n.midiNote - mean) * (n.midiNote - mean);
  const double stdDev = std::sqrt(variance / (double)notes.size());

  if (stdDev == 0.0)
    return notes;

  std::vector<NoteEvent> kept;
  kept.reserve(notes.size());
  for (const auto &n : notes) {
    const double z = std::abs(n.midiNote - mean) / stdDev;
    if (z > config.outlierStdThreshold) {
      DBG("Removing pitch outlier " << n.midiNote << " (z = " << z << ")");
      continue;
    }
    kept.push_back(n);
  }
  return kept;
}

NoteFilter::FilterResult
NoteFilter::filterNotes(const std::vector<NoteEvent> &notes) const {
  FilterResult result;
  result.notes.reserve(notes.size());

  for (const auto &n : notes)
    if (passesThresholds(n))
      result.notes.push_back(n);

  if (config.removeOutliers)
    result.notes = removePitchOutliers(result.notes);

  result.removedCount = (int)(notes.size() - result.notes.size());
  return result;
}

NoteFilter::FilterStatistics
NoteFilter::getFilterStatistics(const std::vector<NoteEvent> &original,
                                const std::vector<NoteEvent> &filtered) {
  FilterStatistics stats;
  stats.originalCount = (int)original.size();
  stats.filteredCount = (int)filtered.size();
  stats.removedCount = stats.originalCount - stats.filteredCount;

  if (stats.originalCount > 0) {
    stats.removalPercentage = 100.0 * stats.removedCount / stats.originalCount;
    stats.retentionPercentage = 100.0 * stats.filteredCount / stats.originalCount;
  }
  return stats;
}
