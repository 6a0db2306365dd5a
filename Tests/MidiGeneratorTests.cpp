// Tests for MidiGenerator.h -- single and multi-track MIDI documents.

#include "Audio2MidiErrors.h"
#include "MidiGenerator.h"
#include "TestSignals.h"

#include <gtest/gtest.h>

namespace {

using Reason = MidiGenerationError::Reason;
using TestSignals::makeNote;

Reason reasonOf(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const MidiGenerationError &e) {
    return e.getReason();
  }
  ADD_FAILURE() << "expected MidiGenerationError";
  return Reason::writeFailed;
}

int countNoteOns(const juce::MidiMessageSequence &seq, int *channel = nullptr) {
  int count = 0;
  for (const auto *holder : seq) {
    if (holder->message.isNoteOn()) {
      ++count;
      if (channel != nullptr)
        *channel = holder->message.getChannel();
    }
  }
  return count;
}

// ---------------------------------------------------------------------------
// createMidi
// ---------------------------------------------------------------------------

TEST(MidiGeneratorTest, SingleTrackLayout) {
  MidiGenerator generator(120.0);
  const auto doc = generator.createMidi(
      {makeNote(0.0, 0.5, 60), makeNote(0.5, 1.0, 64), makeNote(1.0, 2.0, 67)});

  ASSERT_EQ(doc.file.getNumTracks(), 2);
  EXPECT_EQ(doc.file.getTimeFormat(), MidiGenerator::ticksPerQuarterNote);
  EXPECT_EQ(doc.getNumInstrumentTracks(), 1);
  EXPECT_EQ(countNoteOns(*doc.file.getTrack(1)), 3);
  EXPECT_EQ(countNoteOns(*doc.file.getTrack(0)), 0);
}

TEST(MidiGeneratorTest, TempoTrackCarriesTempoAndMeter) {
  MidiGenerator generator(90.0);
  const auto doc = generator.createMidi({makeNote(0.0, 1.0)});
  const auto *tempoTrack = doc.file.getTrack(0);

  bool sawTempo = false, sawMeter = false;
  for (const auto *holder : *tempoTrack) {
    const auto &m = holder->message;
    if (m.isTempoMetaEvent()) {
      sawTempo = true;
      EXPECT_NEAR(60.0 / m.getTempoSecondsPerQuarterNote(), 90.0, 1e-3);
    }
    if (m.isTimeSignatureMetaEvent()) {
      int num = 0, den = 0;
      m.getTimeSignatureInfo(num, den);
      EXPECT_EQ(num, 4);
      EXPECT_EQ(den, 4);
      sawMeter = true;
    }
  }
  EXPECT_TRUE(sawTempo);
  EXPECT_TRUE(sawMeter);
}

TEST(MidiGeneratorTest, SecondsBecomeTicks) {
  MidiGenerator generator(120.0);
  const auto doc = generator.createMidi({makeNote(0.5, 1.0, 60)});

  for (const auto *holder : *doc.file.getTrack(1)) {
    if (holder->message.isNoteOn())
      EXPECT_DOUBLE_EQ(holder->message.getTimeStamp(), 960.0);
    if (holder->message.isNoteOff())
      EXPECT_DOUBLE_EQ(holder->message.getTimeStamp(), 1920.0);
  }
}

TEST(MidiGeneratorTest, DistinctReasonsForBadNotes) {
  MidiGenerator generator;
  EXPECT_EQ(reasonOf([&] { generator.createMidi({}); }), Reason::noNotes);
  EXPECT_EQ(reasonOf([&] { generator.createMidi({makeNote(-0.1, 0.5)}); }),
            Reason::negativeTime);
  EXPECT_EQ(reasonOf([&] { generator.createMidi({makeNote(1.0, 1.0)}); }),
            Reason::invalidDuration);
  EXPECT_EQ(reasonOf([&] { generator.createMidi({makeNote(0.0, 1.0, 128)}); }),
            Reason::invalidPitch);
  EXPECT_EQ(reasonOf([&] { generator.createMidi({makeNote(0.0, 1.0, 60, 0)}); }),
            Reason::invalidVelocity);
  EXPECT_EQ(reasonOf([&] { generator.createMidi({makeNote(0.0, 1.0, 60, 128)}); }),
            Reason::invalidVelocity);
}

TEST(MidiGeneratorTest, RejectsBadTempo) {
  EXPECT_EQ(reasonOf([] { MidiGenerator g(0.0); }), Reason::invalidTempo);
  MidiGenerator generator;
  EXPECT_EQ(reasonOf([&] { generator.setTempo(-5.0); }), Reason::invalidTempo);
  EXPECT_DOUBLE_EQ(generator.getTempo(), 120.0);
}

// ---------------------------------------------------------------------------
// createMultiTrackMidi
// ---------------------------------------------------------------------------

TEST(MidiGeneratorTest, MultiTrack_DrumsOnChannelNine) {
  MidiGenerator generator;
  const StemNoteMap stems{{"vocals", {makeNote(0.0, 0.5, 64)}},
                          {"drums", {makeNote(0.0, 0.1, 36), makeNote(0.5, 0.6, 38)}},
                          {"bass", {makeNote(0.0, 1.0, 40)}},
                          {"other", {makeNote(0.0, 1.0, 67)}}};
  const auto doc = generator.createMultiTrackMidi(stems);

  ASSERT_EQ(doc.getNumInstrumentTracks(), 4);
  ASSERT_EQ(doc.file.getNumTracks(), 5);

  for (size_t i = 0; i < doc.tracks.size(); ++i) {
    const auto &t = doc.tracks[i];
    if (t.isDrum)
      EXPECT_EQ(t.channel, MidiGenerator::drumChannel);
    else
      EXPECT_NE(t.channel, MidiGenerator::drumChannel);

    int juceChannel = 0;
    EXPECT_EQ(countNoteOns(*doc.file.getTrack((int)i + 1), &juceChannel), t.noteCount);
    EXPECT_EQ(juceChannel, t.channel + 1);
  }

  EXPECT_EQ(doc.tracks[0].name, "vocals");
  EXPECT_EQ(doc.tracks[0].program, 52);
  EXPECT_EQ(doc.tracks[0].channel, 0);
  EXPECT_TRUE(doc.tracks[1].isDrum);
  EXPECT_EQ(doc.tracks[2].program, 32);
  EXPECT_EQ(doc.tracks[2].channel, 1);
  EXPECT_EQ(doc.tracks[3].channel, 2);
}

TEST(MidiGeneratorTest, MultiTrack_EmptyStemsAreSkipped) {
  MidiGenerator generator;
  const auto doc = generator.createMultiTrackMidi(
      {{"drums", {makeNote(0.0, 0.1, 36)}}, {"bass", {}}});

  ASSERT_EQ(doc.getNumInstrumentTracks(), 1);
  EXPECT_EQ(doc.tracks[0].name, "drums");
  EXPECT_EQ(doc.tracks[0].channel, 9);
  EXPECT_EQ(doc.file.getNumTracks(), 2);
}

TEST(MidiGeneratorTest, MultiTrack_DrumTrackHasNoProgramChange) {
  MidiGenerator generator;
  const auto doc = generator.createMultiTrackMidi({{"drums", {makeNote(0.0, 0.1, 36)}},
                                                   {"bass", {makeNote(0.0, 0.5, 40)}}});
  auto hasProgramChange = [](const juce::MidiMessageSequence &seq) {
    for (const auto *holder : seq)
      if (holder->message.isProgramChange())
        return true;
    return false;
  };
  EXPECT_FALSE(hasProgramChange(*doc.file.getTrack(1)));
  EXPECT_TRUE(hasProgramChange(*doc.file.getTrack(2)));
}

TEST(MidiGeneratorTest, MultiTrack_NeverPutsMelodyOnDrumChannel) {
  MidiGenerator generator;
  StemNoteMap stems;
  for (int i = 0; i < 20; ++i)
    stems.push_back({"synth" + juce::String(i), {makeNote(0.0, 0.5, 60 + i)}});

  const auto doc = generator.createMultiTrackMidi(stems);
  ASSERT_EQ(doc.getNumInstrumentTracks(), 20);
  for (const auto &t : doc.tracks) {
    EXPECT_NE(t.channel, MidiGenerator::drumChannel);
    EXPECT_GE(t.channel, 0);
    EXPECT_LE(t.channel, 15);
  }
}

TEST(MidiGeneratorTest, MultiTrack_StemErrors) {
  MidiGenerator generator;
  EXPECT_EQ(reasonOf([&] { generator.createMultiTrackMidi({}); }), Reason::noStems);
  EXPECT_EQ(reasonOf([&] { generator.createMultiTrackMidi({{"  ", {makeNote(0.0, 1.0)}}}); }),
            Reason::invalidStemName);
  EXPECT_EQ(reasonOf([&] {
              generator.createMultiTrackMidi(
                  {{"bass", {makeNote(0.0, 1.0)}}, {"bass", {makeNote(1.0, 2.0)}}});
            }),
            Reason::duplicateStem);
  EXPECT_EQ(reasonOf([&] {
              generator.createMultiTrackMidi({{"bass", {makeNote(0.0, 1.0, 200)}}});
            }),
            Reason::invalidPitch);
}

TEST(MidiGeneratorTest, MultiTrack_OverrideMap) {
  MidiGenerator generator;
  InstrumentMap overrides{{"Lead", {"Lead", 81, false}}, {"kit", {"kit", 0, true}}};
  const auto doc = generator.createMultiTrackMidi(
      {{"lead", {makeNote(0.0, 1.0, 72)}}, {"kit", {makeNote(0.0, 0.1, 36)}}}, &overrides);

  ASSERT_EQ(doc.tracks.size(), 2u);
  EXPECT_EQ(doc.tracks[0].program, 81);
  EXPECT_TRUE(doc.tracks[1].isDrum);
  EXPECT_EQ(doc.tracks[1].channel, 9);
}

TEST(MidiGeneratorTest, InstrumentMapForStems) {
  MidiGenerator generator(120.0, 5);
  const auto map = generator.getInstrumentMapForStems({"Vocals", "percussion", "theremin"});
  EXPECT_EQ(map.at("Vocals").program, 52);
  EXPECT_TRUE(map.at("percussion").isDrum);
  EXPECT_EQ(map.at("theremin").program, 5);
  EXPECT_FALSE(map.at("theremin").isDrum);
}

// ---------------------------------------------------------------------------
// Info and file output
// ---------------------------------------------------------------------------

TEST(MidiGeneratorTest, MidiInfo) {
  const auto info = MidiGenerator::getMidiInfo(
      {makeNote(0.5, 1.0, 60, 60), makeNote(1.0, 3.0, 72, 100)});
  EXPECT_EQ(info.noteCount, 2);
  EXPECT_DOUBLE_EQ(info.duration, 2.5);
  EXPECT_EQ(info.pitchRange, std::make_pair(60, 72));
  EXPECT_DOUBLE_EQ(info.averageVelocity, 80.0);

  EXPECT_EQ(MidiGenerator::getMidiInfo(std::vector<NoteEvent>{}).noteCount, 0);
}

TEST(MidiGeneratorTest, MidiInfoForStems) {
  const StemNoteMap stems{{"bass", {makeNote(0.0, 1.0, 40)}},
                          {"vocals", {makeNote(0.0, 2.0, 70), makeNote(2.0, 3.0, 72)}},
                          {"drums", {}}};
  const auto info = MidiGenerator::getMidiInfo(stems);
  EXPECT_EQ(info.noteCount, 3);
  EXPECT_EQ(info.pitchRange, std::make_pair(40, 72));
  ASSERT_EQ(info.stems.size(), 3u);
  EXPECT_EQ(info.stems[1].second.noteCount, 2);
  EXPECT_EQ(info.stems[2].second.noteCount, 0);
}

TEST(MidiGeneratorTest, WriteAndReadBack) {
  TestSignals::ScopedTempDir dir;
  const auto target = dir.file("nested/out.mid");

  MidiGenerator generator(100.0);
  generator.createMidi({makeNote(0.0, 0.5, 60), makeNote(0.5, 1.0, 62)}).writeTo(target);
  ASSERT_TRUE(target.existsAsFile());

  juce::FileInputStream in(target);
  ASSERT_TRUE(in.openedOk());
  juce::MidiFile readBack;
  ASSERT_TRUE(readBack.readFrom(in));
  EXPECT_EQ(readBack.getNumTracks(), 2);
  EXPECT_EQ(countNoteOns(*readBack.getTrack(1)), 2);
}

} // namespace
