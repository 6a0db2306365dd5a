#pragma once

#include "NoteTypes.h"
#include <optional>
#include <vector>

/** Musical grid unit, named by note value. */
enum class QuantizationGrid { quarter, eighth, sixteenth, thirtySecond, none };

/** Fraction of a beat covered by one grid unit; 0 for none. */
constexpr double gridFraction(QuantizationGrid grid) {
  switch (grid) {
  case QuantizationGrid::quarter:
    return 1.0;
  case QuantizationGrid::eighth:
    return 0.5;
  case QuantizationGrid::sixteenth:
    return 0.25;
  case QuantizationGrid::thirtySecond:
    return 0.125;
  case QuantizationGrid::none:
    return 0.0;
  }
  return 0.0;
}

/**
 * NoteQuantizer
 *
 * Snaps note start and end times to the nearest multiple of the grid unit,
 * 60 / bpm * gridFraction seconds. A note that collapses below one unit is
 * stretched to one unit. Quantizing twice gives the same times.
 *
 * Times are grid index * unit, so every note spans at least one whole grid
 * index; end - start in seconds can still fall short of unit by the rounding
 * of the end time (one ulp of endTime).
 */
class NoteQuantizer {
public:
  explicit NoteQuantizer(QuantizationGrid grid = QuantizationGrid::sixteenth);

  /** Throws InvalidInputError if tempoBpm is not positive. */
  std::vector<NoteEvent> quantizeNotes(const std::vector<NoteEvent> &notes,
                                       double tempoBpm) const;

  NoteEvent quantizeSingleNote(const NoteEvent &note, double tempoBpm) const;

  /** Length of one grid unit in seconds, 0 for QuantizationGrid::none. */
  double gridSizeSeconds(double tempoBpm) const;

  QuantizationGrid getGrid() const { return grid; }
  void setGrid(QuantizationGrid newGrid) { grid = newGrid; }

  /** Accepts "QUARTER", "eighth", "1/16", "thirty_second", "none" and so on. */
  static std::optional<QuantizationGrid> gridFromName(const juce::String &name);
  static juce::String gridName(QuantizationGrid grid);

private:
  NoteEvent snap(const NoteEvent &note, double unit) const;

  QuantizationGrid grid;
};
