// Tests for NoteFilter.h -- threshold checks, pitch outliers, statistics.

#include "NoteFilter.h"
#include "TestSignals.h"

#include <gtest/gtest.h>

namespace {

using TestSignals::makeNote;

FilterConfig withoutOutliers() {
  FilterConfig config;
  config.removeOutliers = false;
  return config;
}

TEST(NoteFilterTest, KeepsGoodNotesInOrder) {
  NoteFilter filter(withoutOutliers());
  const std::vector<NoteEvent> notes{makeNote(0.0, 0.5, 60), makeNote(0.5, 1.0, 62),
                                     makeNote(1.0, 1.5, 64)};
  const auto result = filter.filterNotes(notes);
  EXPECT_EQ(result.notes, notes);
  EXPECT_EQ(result.removedCount, 0);
}

TEST(NoteFilterTest, DropsLowConfidence) {
  NoteFilter filter(withoutOutliers());
  const auto result = filter.filterNotes(
      {makeNote(0.0, 0.5, 60, 80, 0.29), makeNote(0.5, 1.0, 62, 80, 0.3)});
  ASSERT_EQ(result.notes.size(), 1u);
  EXPECT_EQ(result.notes[0].midiNote, 62);
  EXPECT_EQ(result.removedCount, 1);
}

TEST(NoteFilterTest, DurationBoundsAreInclusive) {
  NoteFilter filter(withoutOutliers());
  const auto result = filter.filterNotes({makeNote(0.0, 0.04), makeNote(1.0, 1.05),
                                          makeNote(2.0, 12.0), makeNote(13.0, 24.0)});
  ASSERT_EQ(result.notes.size(), 2u);
  EXPECT_DOUBLE_EQ(result.notes[0].startTime, 1.0);
  EXPECT_DOUBLE_EQ(result.notes[1].startTime, 2.0);
}

TEST(NoteFilterTest, DropsQuietNotes) {
  NoteFilter filter(withoutOutliers());
  const auto result =
      filter.filterNotes({makeNote(0.0, 0.5, 60, 19), makeNote(0.5, 1.0, 60, 20)});
  ASSERT_EQ(result.notes.size(), 1u);
  EXPECT_EQ(result.notes[0].velocity, 20);
}

TEST(NoteFilterTest, RemovesPitchOutlier) {
  FilterConfig config;
  config.outlierStdThreshold = 2.0;
  NoteFilter filter(config);

  std::vector<NoteEvent> notes;
  for (int i = 0; i < 10; ++i)
    notes.push_back(makeNote(i * 0.5, i * 0.5 + 0.4, 60 + i % 2));
  notes.push_back(makeNote(5.0, 5.4, 120));

  const auto result = filter.filterNotes(notes);
  EXPECT_EQ(result.notes.size(), 10u);
  for (const auto &n : result.notes)
    EXPECT_NE(n.midiNote, 120);
  EXPECT_EQ(result.removedCount, 1);
}

TEST(NoteFilterTest, OutliersNeedThreeNotes) {
  NoteFilter filter;
  const std::vector<NoteEvent> notes{makeNote(0.0, 0.5, 20), makeNote(0.5, 1.0, 120)};
  EXPECT_EQ(filter.removePitchOutliers(notes), notes);
}

TEST(NoteFilterTest, IdenticalPitchesHaveNoOutliers) {
  NoteFilter filter;
  const std::vector<NoteEvent> notes(5, makeNote(0.0, 0.5, 64));
  EXPECT_EQ(filter.removePitchOutliers(notes).size(), 5u);
}

TEST(NoteFilterTest, NeverGrowsAndLeavesInputAlone) {
  NoteFilter filter;
  std::vector<NoteEvent> notes;
  for (int i = 0; i < 20; ++i)
    notes.push_back(makeNote(i * 0.1, i * 0.1 + 0.03 * (i % 4), 40 + i, 10 * (i % 13),
                             0.1 * (i % 10)));
  const auto copy = notes;

  const auto result = filter.filterNotes(notes);
  EXPECT_LE(result.notes.size(), notes.size());
  EXPECT_EQ(notes, copy);
  EXPECT_EQ(result.removedCount, (int)(notes.size() - result.notes.size()));
}

TEST(NoteFilterTest, EmptyInput) {
  NoteFilter filter;
  const auto result = filter.filterNotes({});
  EXPECT_TRUE(result.notes.empty());
  EXPECT_EQ(result.removedCount, 0);
}

TEST(NoteFilterTest, Statistics) {
  const std::vector<NoteEvent> original(4, makeNote(0.0, 0.5));
  const std::vector<NoteEvent> filtered(3, makeNote(0.0, 0.5));
  const auto stats = NoteFilter::getFilterStatistics(original, filtered);
  EXPECT_EQ(stats.originalCount, 4);
  EXPECT_EQ(stats.filteredCount, 3);
  EXPECT_EQ(stats.removedCount, 1);
  EXPECT_DOUBLE_EQ(stats.removalPercentage, 25.0);
  EXPECT_DOUBLE_EQ(stats.retentionPercentage, 75.0);

  const auto none = NoteFilter::getFilterStatistics({}, {});
  EXPECT_DOUBLE_EQ(none.removalPercentage, 0.0);
}

} // namespace
