// Repository: captionline
// Component: Discontinuity Sequencer
// Purpose: Detect gaps in main-stream fragment sequence numbers.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_TIMELINE_DISCONTINUITY_SEQUENCER_H_
#define CAPTIONLINE_TIMELINE_DISCONTINUITY_SEQUENCER_H_

#include <cstdint>

namespace captionline::timeline {

// DiscontinuitySequencer tracks the last main fragment sequence number.
// A fragment that does not directly follow the previous one (seek, level
// switch, first fragment) means the caption decoder may hold control codes
// from unrelated video and must be reset.
class DiscontinuitySequencer {
 public:
  static constexpr int64_t kNoSequence = -1;

  // Records `sn` and returns true when it is not `last + 1`.
  bool OnMainFragment(int64_t sn);

  void Reset() { last_sn_ = kNoSequence; }

  int64_t LastSequenceNumber() const { return last_sn_; }

 private:
  int64_t last_sn_ = kNoSequence;
};

}  // namespace captionline::timeline

#endif  // CAPTIONLINE_TIMELINE_DISCONTINUITY_SEQUENCER_H_
