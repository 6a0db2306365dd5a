#include "MidiGenerator.h"
#include "Audio2MidiErrors.h"
#include <algorithm>
#include <array>
#include <set>

namespace {

void checkTempo(double bpm) {
  if (!(bpm > 0.0))
    throw MidiGenerationError(MidiGenerationError::Reason::invalidTempo,
                              "Tempo must be positive, got " + juce::String(bpm));
}

const InstrumentMapping *findMapping(const InstrumentMap &map,
                                     const juce::String &stemName) {
  auto exact = map.find(stemName);
  if (exact != map.end())
    return &exact->second;

  for (const auto &entry : map)
    if (entry.first.equalsIgnoreCase(stemName))
      return &entry.second;

  return nullptr;
}

bool looksLikePercussion(const juce::String &lowerName) {
  return lowerName.contains("drum") || lowerName.contains("percussion");
}

} // namespace

// ---------------------------------------------------------------------------
// MidiDocument
// ---------------------------------------------------------------------------

void MidiDocument::writeTo(const juce::File &target) const {
  const auto dir = target.getParentDirectory();
  if (!dir.isDirectory()) {
    const auto created = dir.createDirectory();
    if (created.failed())
      throw MidiGenerationError(MidiGenerationError::Reason::writeFailed,
                                "Cannot create " + dir.getFullPathName() +
                                    ": " + created.getErrorMessage());
  }

  juce::FileOutputStream stream(target);
  if (!stream.openedOk())
    throw MidiGenerationError(MidiGenerationError::Reason::writeFailed,
                              "Cannot open " + target.getFullPathName() +
                                  " for writing: " +
                                  stream.getStatus().getErrorMessage());

  if (!stream.setPosition(0) || stream.truncate().failed() ||
      !file.writeTo(stream, 1))
    throw MidiGenerationError(MidiGenerationError::Reason::writeFailed,
                              "Failed to write MIDI data to " +
                                  target.getFullPathName());

  stream.flush();
}

// ---------------------------------------------------------------------------
// MidiGenerator
// ---------------------------------------------------------------------------

MidiGenerator::MidiGenerator(double bpm, int prog)
    : tempoBpm(bpm), program(juce::jlimit(0, 127, prog)) {
  checkTempo(bpm);
}

void MidiGenerator::setTempo(double newTempo) {
  checkTempo(newTempo);
  tempoBpm = newTempo;
}

const InstrumentMap &MidiGenerator::getDefaultInstrumentMap() {
  static const InstrumentMap defaults = {
      {"vocals", {"vocals", 52, false}}, // Choir Aahs
      {"drums", {"drums", 0, true}},
      {"bass", {"bass", 32, false}},     // Acoustic Bass
      {"other", {"other", 48, false}},   // String Ensemble 1
      {"guitar", {"guitar", 26, false}}, // Electric Guitar (jazz)
      {"piano", {"piano", 0, false}},    // Acoustic Grand Piano
  };
  return defaults;
}

InstrumentMap
MidiGenerator::getInstrumentMapForStems(const juce::StringArray &stemNames) const {
  InstrumentMap mapping;
  const auto &defaults = getDefaultInstrumentMap();

  for (const auto &name : stemNames) {
    const auto lower = name.toLowerCase();
    auto it = defaults.find(lower);
    if (it != defaults.end()) {
      mapping[name] = it->second;
      mapping[name].stemName = name;
    } else {
      mapping[name] = {name, program, looksLikePercussion(lower)};
    }
  }
  return mapping;
}

double MidiGenerator::secondsToTicks(double seconds) const {
  // One tempo for the whole file, so seconds scale linearly to ticks.
  return seconds * ticksPerQuarterNote * (tempoBpm / 60.0);
}

juce::MidiMessageSequence MidiGenerator::createTempoTrack() const {
  juce::MidiMessageSequence tempoTrack;
  const int microsPerBeat = juce::roundToInt(60000000.0 / tempoBpm);
  tempoTrack.addEvent(juce::MidiMessage::tempoMetaEvent(microsPerBeat), 0);
  tempoTrack.addEvent(juce::MidiMessage::timeSignatureMetaEvent(4, 4), 0);
  return tempoTrack;
}

juce::MidiMessageSequence MidiGenerator::createInstrumentTrack(
    const juce::String &name, int channel, int prog, bool isDrum,
    const std::vector<NoteEvent> &notes) const {
  juce::MidiMessageSequence seq;
  const int juceChannel = channel + 1;

  seq.addEvent(juce::MidiMessage::textMetaEvent(3, name), 0);
  if (!isDrum)
    seq.addEvent(juce::MidiMessage::programChange(juceChannel, prog), 0);

  for (const auto &note : notes) {
    auto on = juce::MidiMessage::noteOn(juceChannel, note.midiNote,
                                        (juce::uint8)note.velocity);
    auto off = juce::MidiMessage::noteOff(juceChannel, note.midiNote);

    seq.addEvent(on, secondsToTicks(note.startTime));
    seq.addEvent(off, secondsToTicks(note.endTime));
  }

  seq.updateMatchedPairs();
  return seq;
}

void MidiGenerator::validateNoteEvents(const std::vector<NoteEvent> &notes) {
  using Reason = MidiGenerationError::Reason;

  if (notes.empty())
    throw MidiGenerationError(Reason::noNotes, "No note events provided");

  for (size_t i = 0; i < notes.size(); ++i) {
    const auto &n = notes[i];
    const auto prefix = "Note " + juce::String((int)i);

    if (n.startTime < 0.0 || n.endTime < 0.0)
      throw MidiGenerationError(Reason::negativeTime,
                                prefix + " has negative time values: start=" +
                                    juce::String(n.startTime) +
                                    ", end=" + juce::String(n.endTime));

    if (!(n.endTime > n.startTime))
      throw MidiGenerationError(Reason::invalidDuration,
                                prefix + " has invalid duration: start=" +
                                    juce::String(n.startTime) +
                                    ", end=" + juce::String(n.endTime));

    if (n.midiNote < 0 || n.midiNote > 127)
      throw MidiGenerationError(Reason::invalidPitch,
                                prefix + " has invalid MIDI note: " +
                                    juce::String(n.midiNote) + " (must be 0-127)");

    if (n.velocity < 1 || n.velocity > 127)
      throw MidiGenerationError(Reason::invalidVelocity,
                                prefix + " has invalid velocity: " +
                                    juce::String(n.velocity) + " (must be 1-127)");
  }
}

MidiDocument MidiGenerator::createMidi(const std::vector<NoteEvent> &notes,
                                       const juce::String &instrumentName) const {
  validateNoteEvents(notes);

  MidiDocument doc;
  doc.tempoBpm = tempoBpm;
  doc.file.setTicksPerQuarterNote(ticksPerQuarterNote);
  doc.file.addTrack(createTempoTrack());
  doc.file.addTrack(createInstrumentTrack(instrumentName, 0, program, false, notes));
  doc.tracks.push_back({instrumentName, program, 0, false, (int)notes.size()});
  return doc;
}

MidiDocument MidiGenerator::createMultiTrackMidi(const StemNoteMap &stems,
                                                 const InstrumentMap *overrideMap) const {
  using Reason = MidiGenerationError::Reason;

  if (stems.empty())
    throw MidiGenerationError(Reason::noStems,
                              "No stems provided for multi-track MIDI generation");

  juce::StringArray names;
  for (const auto &stem : stems) {
    if (stem.stemName.trim().isEmpty())
      throw MidiGenerationError(Reason::invalidStemName,
                                "Stem names must be non-empty strings");
    if (names.contains(stem.stemName))
      throw MidiGenerationError(Reason::duplicateStem,
                                "Stem '" + stem.stemName + "' appears more than once");
    names.add(stem.stemName);
  }

  const auto mapping =
      overrideMap != nullptr ? *overrideMap : getInstrumentMapForStems(names);

  MidiDocument doc;
  doc.tempoBpm = tempoBpm;
  doc.file.setTicksPerQuarterNote(ticksPerQuarterNote);
  doc.file.addTrack(createTempoTrack());

  std::array<bool, 16> usedChannels{};
  int wrapCursor = 0;

  auto nextMelodicChannel = [&]() {
    for (int ch = 0; ch < 16; ++ch) {
      if (ch != drumChannel && !usedChannels[(size_t)ch]) {
        usedChannels[(size_t)ch] = true;
        return ch;
      }
    }
    // All fifteen melodic channels are taken: share them round-robin.
    int ch = wrapCursor;
    if (ch == drumChannel)
      ch = (ch + 1) % 16;
    wrapCursor = (ch + 1) % 16;
    return ch;
  };

  for (const auto &stem : stems) {
    if (stem.notes.empty()) {
      DBG("Skipping stem '" << stem.stemName << "' with no note events");
      continue;
    }

    validateNoteEvents(stem.notes);

    InstrumentMapping cfg{stem.stemName, program, false};
    if (const auto *found = findMapping(mapping, stem.stemName))
      cfg = *found;

    MidiTrackLayout layout;
    layout.name = stem.stemName;
    layout.isDrum = cfg.isDrum;
    layout.noteCount = (int)stem.notes.size();

    if (cfg.isDrum) {
      layout.channel = drumChannel;
      layout.program = 0;
      usedChannels[(size_t)drumChannel] = true;
    } else {
      layout.channel = nextMelodicChannel();
      layout.program = juce::jlimit(0, 127, cfg.program);
    }

    doc.file.addTrack(createInstrumentTrack(layout.name, layout.channel,
                                            layout.program, layout.isDrum,
                                            stem.notes));
    doc.tracks.push_back(layout);
  }

  return doc;
}

// ---------------------------------------------------------------------------
// Info
// ---------------------------------------------------------------------------

MidiInfo MidiGenerator::getMidiInfo(const std::vector<NoteEvent> &notes) {
  MidiInfo info;
  if (notes.empty())
    return info;

  double firstStart = notes.front().startTime;
  double lastEnd = notes.front().endTime;
  int lowest = notes.front().midiNote;
  int highest = notes.front().midiNote;
  double velocitySum = 0.0;

  for (const auto &n : notes) {
    firstStart = juce::jmin(firstStart, n.startTime);
    lastEnd = juce::jmax(lastEnd, n.endTime);
    lowest = juce::jmin(lowest, n.midiNote);
    highest = juce::jmax(highest, n.midiNote);
    velocitySum += n.velocity;
  }

  info.noteCount = (int)notes.size();
  info.duration = lastEnd - firstStart;
  info.pitchRange = {lowest, highest};
  info.averageVelocity = velocitySum / (double)notes.size();
  return info;
}

MidiInfo MidiGenerator::getMidiInfo(const StemNoteMap &stems) {
  MidiInfo info;
  int lowest = 127, highest = 0;
  double velocitySum = 0.0;
  int stemsWithNotes = 0;

  for (const auto &stem : stems) {
    const NoteListInfo stemInfo = getMidiInfo(stem.notes);
    info.stems.emplace_back(stem.stemName, stemInfo);

    info.noteCount += stemInfo.noteCount;
    info.duration = juce::jmax(info.duration, stemInfo.duration);

    if (stemInfo.noteCount > 0) {
      lowest = juce::jmin(lowest, stemInfo.pitchRange.first);
      highest = juce::jmax(highest, stemInfo.pitchRange.second);
      velocitySum += stemInfo.averageVelocity;
      ++stemsWithNotes;
    }
  }

  if (stemsWithNotes > 0) {
    info.pitchRange = {lowest, highest};
    info.averageVelocity = velocitySum / stemsWithNotes;
  }
  return info;
}
