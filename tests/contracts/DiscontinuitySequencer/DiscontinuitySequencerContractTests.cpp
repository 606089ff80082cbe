// Repository: captionline
// Component: Discontinuity Sequencer Contract Tests
// Purpose: Sequence gap detection for main-stream fragments.
// Copyright (c) 2025 captionline authors

#include <gtest/gtest.h>

#include "captionline/timeline/DiscontinuitySequencer.h"

namespace captionline::tests {
namespace {

using timeline::DiscontinuitySequencer;

TEST(DiscontinuitySequencerTest, StartsAtSentinel) {
  DiscontinuitySequencer sequencer;
  EXPECT_EQ(sequencer.LastSequenceNumber(), DiscontinuitySequencer::kNoSequence);
}

TEST(DiscontinuitySequencerTest, FirstFragmentAfterSentinelIsGapUnlessZero) {
  DiscontinuitySequencer a;
  EXPECT_TRUE(a.OnMainFragment(5));

  // -1 + 1 == 0
  DiscontinuitySequencer b;
  EXPECT_FALSE(b.OnMainFragment(0));
}

TEST(DiscontinuitySequencerTest, ContiguousRunThenGap) {
  DiscontinuitySequencer sequencer;
  int gaps = 0;
  for (int64_t sn : {5, 6, 8}) {
    if (sequencer.OnMainFragment(sn)) gaps++;
  }
  EXPECT_EQ(gaps, 2);
  EXPECT_EQ(sequencer.LastSequenceNumber(), 8);
}

TEST(DiscontinuitySequencerTest, BackwardSeekAndRepeatAreGaps) {
  DiscontinuitySequencer sequencer;
  sequencer.OnMainFragment(10);

  EXPECT_TRUE(sequencer.OnMainFragment(3));
  EXPECT_TRUE(sequencer.OnMainFragment(3));
  EXPECT_FALSE(sequencer.OnMainFragment(4));
}

TEST(DiscontinuitySequencerTest, SequenceIsRecordedEvenOnGap) {
  DiscontinuitySequencer sequencer;
  sequencer.OnMainFragment(20);
  EXPECT_EQ(sequencer.LastSequenceNumber(), 20);
  EXPECT_FALSE(sequencer.OnMainFragment(21));
}

TEST(DiscontinuitySequencerTest, ResetRestoresSentinel) {
  DiscontinuitySequencer sequencer;
  sequencer.OnMainFragment(7);
  sequencer.Reset();

  EXPECT_EQ(sequencer.LastSequenceNumber(), DiscontinuitySequencer::kNoSequence);
  EXPECT_TRUE(sequencer.OnMainFragment(8));
}

}  // namespace
}  // namespace captionline::tests
