#include "NoteTypes.h"

namespace NoteUtils {

std::optional<double> noteNameToHz(const juce::String &name) {
  auto text = name.trim();
  if (text.isEmpty())
    return std::nullopt;

  static const int letterOffsets[7] = {9, 11, 0, 2, 4, 5, 7}; // A..G
  const auto letter = juce::CharacterFunctions::toUpperCase(text[0]);
  if (letter < 'A' || letter > 'G')
    return std::nullopt;

  int pitchClass = letterOffsets[letter - 'A'];
  int pos = 1;

  while (pos < text.length() && (text[pos] == '#' || text[pos] == 'b')) {
    pitchClass += text[pos] == '#' ? 1 : -1;
    ++pos;
  }

  auto octaveText = text.substring(pos);
  if (octaveText.isEmpty() ||
      !octaveText.trimCharactersAtStart("-").containsOnly("0123456789"))
    return std::nullopt;

  const int octave = octaveText.getIntValue();
  const int midiNote = 12 * (octave + 1) + pitchClass;
  return midiToHz((double)midiNote);
}

std::optional<double> parseFrequency(const juce::String &text) {
  auto trimmed = text.trim();
  if (trimmed.isEmpty())
    return std::nullopt;

  if (trimmed.containsOnly("0123456789.")) {
    const double hz = trimmed.getDoubleValue();
    if (hz > 0.0)
      return hz;
    return std::nullopt;
  }
  return noteNameToHz(trimmed);
}

} // namespace NoteUtils
