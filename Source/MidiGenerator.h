#pragma once

#include "NoteTypes.h"
#include <juce_audio_basics/juce_audio_basics.h>
#include <map>
#include <utility>
#include <vector>

/** How a stem is voiced in General MIDI. */
struct InstrumentMapping {
  juce::String stemName;
  int program = 0; // 0..127
  bool isDrum = false;
};

using InstrumentMap = std::map<juce::String, InstrumentMapping>;

/** One instrument track as written to the file. Channels are 0-based. */
struct MidiTrackLayout {
  juce::String name;
  int program = 0;
  int channel = 0;
  bool isDrum = false;
  int noteCount = 0;
};

/**
 * A generated Standard MIDI File, type 1.
 *
 * Track 0 holds the tempo and time signature; every following track is one
 * instrument described by the matching entry in tracks.
 */
struct MidiDocument {
  juce::MidiFile file;
  std::vector<MidiTrackLayout> tracks;
  double tempoBpm = 120.0;

  int getNumInstrumentTracks() const { return (int)tracks.size(); }

  /** Throws MidiGenerationError(writeFailed) if the file cannot be written. */
  void writeTo(const juce::File &target) const;
};

/** Summary of one note list. */
struct NoteListInfo {
  int noteCount = 0;
  double duration = 0.0; // last end - first start
  std::pair<int, int> pitchRange{0, 0};
  double averageVelocity = 0.0;
};

/** Summary of a note list or stem map; stems is filled for stem maps only. */
struct MidiInfo : NoteListInfo {
  std::vector<std::pair<juce::String, NoteListInfo>> stems;
};

/**
 * MidiGenerator
 *
 * Turns note lists into MIDI documents at a fixed tempo, 960 ticks per
 * quarter note.
 */
class MidiGenerator {
public:
  static constexpr int ticksPerQuarterNote = 960;
  static constexpr int drumChannel = 9;

  explicit MidiGenerator(double tempoBpm = 120.0, int program = 0);

  /**
   * Single instrument track. Throws MidiGenerationError when the list is
   * empty or any note is malformed.
   */
  MidiDocument
  createMidi(const std::vector<NoteEvent> &notes,
             const juce::String &instrumentName = "Acoustic Grand Piano") const;

  /**
   * One track per stem that has notes; empty stems are skipped. Drums go on
   * channel 9, everything else on the lowest free channel that is not 9.
   * An override map replaces the built-in instrument table.
   */
  MidiDocument createMultiTrackMidi(const StemNoteMap &stems,
                                    const InstrumentMap *overrideMap = nullptr) const;

  InstrumentMap getInstrumentMapForStems(const juce::StringArray &stemNames) const;

  static const InstrumentMap &getDefaultInstrumentMap();

  static MidiInfo getMidiInfo(const std::vector<NoteEvent> &notes);
  static MidiInfo getMidiInfo(const StemNoteMap &stems);

  /** Throws MidiGenerationError with the reason of the first bad note. */
  static void validateNoteEvents(const std::vector<NoteEvent> &notes);

  double getTempo() const { return tempoBpm; }
  void setTempo(double newTempo);
  int getProgram() const { return program; }

private:
  double secondsToTicks(double seconds) const;
  juce::MidiMessageSequence createTempoTrack() const;
  juce::MidiMessageSequence createInstrumentTrack(const juce::String &name,
                                                  int channel, int program,
                                                  bool isDrum,
                                                  const std::vector<NoteEvent> &notes) const;

  double tempoBpm;
  int program;
};
