#include "NoteQuantizer.h"
#include "Audio2MidiErrors.h"
#include <cmath>

NoteQuantizer::NoteQuantizer(QuantizationGrid g) : grid(g) {}

double NoteQuantizer::gridSizeSeconds(double tempoBpm) const {
  if (!(tempoBpm > 0.0))
    throw InvalidInputError("Tempo must be positive, got " +
                            juce::String(tempoBpm));
  return 60.0 / tempoBpm * gridFraction(grid);
}

NoteEvent NoteQuantizer::snap(const NoteEvent &note, double unit) const {
  // Work in grid indices so a second pass lands on the same doubles.
  const double startIndex = std::round(note.startTime / unit);
  double endIndex = std::round(note.endTime / unit);
  if (endIndex - startIndex < 1.0)
    endIndex = startIndex + 1.0;

  NoteEvent quantized = note;
  quantized.startTime = startIndex * unit;
  quantized.endTime = endIndex * unit;
  return quantized;
}

NoteEvent NoteQuantizer::quantizeSingleNote(const NoteEvent &note,
                                            double tempoBpm) const {
  const double unit = gridSizeSeconds(tempoBpm);
  if (unit <= 0.0)
    return note;
  return snap(note, unit);
}

std::vector<NoteEvent>
NoteQuantizer::quantizeNotes(const std::vector<NoteEvent> &notes,
                             double tempoBpm) const {
  const double unit = gridSizeSeconds(tempoBpm);
  if (unit <= 0.0)
    return notes;

  std::vector<NoteEvent> quantized;
  quantized.reserve(notes.size());
  for (const auto &n : notes)
    quantized.push_back(snap(n, unit));
  return quantized;
}

std::optional<QuantizationGrid>
NoteQuantizer::gridFromName(const juce::String &name) {
  const auto key = name.trim().toLowerCase().removeCharacters("_- ");

  if (key == "quarter" || key == "1/4")
    return QuantizationGrid::quarter;
  if (key == "eighth" || key == "1/8")
    return QuantizationGrid::eighth;
  if (key == "sixteenth" || key == "1/16")
    return QuantizationGrid::sixteenth;
  if (key == "thirtysecond" || key == "1/32")
    return QuantizationGrid::thirtySecond;
  if (key == "none" || key == "off")
    return QuantizationGrid::none;

  return std::nullopt;
}

juce::String NoteQuantizer::gridName(QuantizationGrid grid) {
  switch (grid) {
  case QuantizationGrid::quarter:
    return "QUARTER";
  case QuantizationGrid::eighth:
    return "EIGHTH";
  case QuantizationGrid::sixteenth:
    return "SIXTEENTH";
  case QuantizationGrid::thirtySecond:
    return "THIRTY_SECOND";
  case QuantizationGrid::none:
    return "NONE";
  }
  return "NONE";
}
