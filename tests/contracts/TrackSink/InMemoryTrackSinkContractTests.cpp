// Repository: captionline
// Component: In-Memory Track Sink Contract Tests
// Purpose: Track creation, cue storage and lookup.
// Copyright (c) 2025 captionline authors

#include <gtest/gtest.h>

#include <string>

#include "captionline/output/InMemoryTrackSink.h"

namespace captionline::tests {
namespace {

using output::InMemoryTrackSink;
using output::TrackHandle;
using output::TrackKind;
using output::TrackMode;

timeline::Cue MakeCue(const std::string& id, double start, double end) {
  timeline::Cue cue;
  cue.id = id;
  cue.start_time = start;
  cue.end_time = end;
  cue.payload = "text";
  return cue;
}

class InMemoryTrackSinkTest : public ::testing::Test {
 protected:
  InMemoryTrackSink sink_;
};

TEST_F(InMemoryTrackSinkTest, CreatedTracksAreListedInCreationOrder) {
  TrackHandle a = sink_.CreateTrack(TrackKind::kCaptions, "English", "en");
  TrackHandle b = sink_.CreateTrack(TrackKind::kSubtitles, "French", "fr");

  EXPECT_NE(a, b);
  auto tracks = sink_.ListTracks();
  ASSERT_EQ(tracks.size(), 2u);
  EXPECT_EQ(tracks[0].handle, a);
  EXPECT_EQ(tracks[0].kind, TrackKind::kCaptions);
  EXPECT_EQ(tracks[0].label, "English");
  EXPECT_EQ(tracks[0].language, "en");
  EXPECT_EQ(tracks[0].mode, TrackMode::kHidden);
  EXPECT_EQ(tracks[0].caption_channel, 0);
  EXPECT_EQ(tracks[1].handle, b);
  EXPECT_EQ(tracks[1].kind, TrackKind::kSubtitles);
}

TEST_F(InMemoryTrackSinkTest, ModeAndChannelTagAreApplied) {
  TrackHandle track = sink_.CreateTrack(TrackKind::kCaptions, "English", "en");
  sink_.SetTrackMode(track, TrackMode::kShowing);
  sink_.TagCaptionChannel(track, 2);

  auto info = sink_.GetTrack(track);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->mode, TrackMode::kShowing);
  EXPECT_EQ(info->caption_channel, 2);
}

TEST_F(InMemoryTrackSinkTest, CuesAreStoredInInsertionOrderAndFoundById) {
  TrackHandle track = sink_.CreateTrack(TrackKind::kSubtitles, "English", "en");
  ASSERT_TRUE(sink_.AddCue(track, MakeCue("b", 2.0, 3.0)));
  ASSERT_TRUE(sink_.AddCue(track, MakeCue("a", 0.0, 1.0)));

  auto cues = sink_.GetCues(track);
  ASSERT_EQ(cues.size(), 2u);
  EXPECT_EQ(cues[0].id, "b");
  EXPECT_EQ(cues[1].id, "a");

  auto found = sink_.FindCueById(track, "a");
  ASSERT_TRUE(found.has_value());
  EXPECT_DOUBLE_EQ(found->end_time, 1.0);
  EXPECT_FALSE(sink_.FindCueById(track, "missing").has_value());
}

TEST_F(InMemoryTrackSinkTest, CueLookupIsPerTrack) {
  TrackHandle a = sink_.CreateTrack(TrackKind::kSubtitles, "A", "en");
  TrackHandle b = sink_.CreateTrack(TrackKind::kSubtitles, "B", "en");
  sink_.AddCue(a, MakeCue("x", 0.0, 1.0));

  EXPECT_TRUE(sink_.FindCueById(a, "x").has_value());
  EXPECT_FALSE(sink_.FindCueById(b, "x").has_value());
}

TEST_F(InMemoryTrackSinkTest, ClearCuesEmptiesTrackAndCounts) {
  TrackHandle track = sink_.CreateTrack(TrackKind::kCaptions, "English", "en");
  sink_.AddCue(track, MakeCue("x", 0.0, 1.0));
  sink_.ClearCues(track);
  sink_.AnnounceTrack(track);

  EXPECT_EQ(sink_.CueCount(track), 0u);
  EXPECT_EQ(sink_.ClearCount(track), 1u);
  EXPECT_EQ(sink_.AnnounceCount(track), 1u);
}

TEST_F(InMemoryTrackSinkTest, UnknownHandlesAreIgnored) {
  const TrackHandle unknown = 999;
  EXPECT_FALSE(sink_.AddCue(unknown, MakeCue("x", 0.0, 1.0)));
  EXPECT_FALSE(sink_.FindCueById(unknown, "x").has_value());
  EXPECT_FALSE(sink_.GetTrack(unknown).has_value());
  sink_.ClearCues(unknown);
  sink_.SetTrackMode(unknown, TrackMode::kShowing);
  EXPECT_EQ(sink_.TrackCount(), 0u);
}

TEST(TrackNamesTest, NamesAreStable) {
  EXPECT_STREQ(output::TrackKindName(TrackKind::kCaptions), "captions");
  EXPECT_STREQ(output::TrackKindName(TrackKind::kSubtitles), "subtitles");
  EXPECT_STREQ(output::TrackModeName(TrackMode::kDisabled), "disabled");
  EXPECT_STREQ(output::TrackModeName(TrackMode::kHidden), "hidden");
  EXPECT_STREQ(output::TrackModeName(TrackMode::kShowing), "showing");
}

}  // namespace
}  // namespace captionline::tests
