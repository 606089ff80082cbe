// Repository: captionline
// Component: Continuity Map
// Purpose: Per-discontinuity rebasing state handed to the subtitle parser.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_TIMELINE_CONTINUITY_MAP_H_
#define CAPTIONLINE_TIMELINE_CONTINUITY_MAP_H_

#include <cstddef>
#include <cstdint>
#include <map>

namespace captionline::timeline {

// First subtitle fragment seen for a discontinuity id.
struct DiscontinuitySegment {
  double base_start_time = 0.0;         // Fragment start of that first fragment
  int32_t previous_discontinuity_id = -1;
  // Set on insertion. The controller never clears it; a parser may treat it
  // as one-shot.
  bool first_seen = true;
};

// ContinuityMap lets a subtitle parser translate segment-relative cue times
// to the absolute media timeline across splices (ad breaks, stream switches).
//
// Entries are created by Rebase() the first time a discontinuity id is
// reported and are only removed by Reset().
class ContinuityMap {
 public:
  static constexpr int32_t kNoDiscontinuity = -1;

  ContinuityMap() = default;

  // Inserts {fragment_start, last id, first_seen} if `cc` is unseen.
  // Returns the (possibly pre-existing) entry for `cc`.
  const DiscontinuitySegment& Rebase(int32_t cc, double fragment_start);

  const DiscontinuitySegment* Find(int32_t cc) const;
  DiscontinuitySegment* Find(int32_t cc);

  bool Contains(int32_t cc) const { return segments_.count(cc) != 0; }
  size_t Size() const { return segments_.size(); }

  int32_t LastDiscontinuityId() const { return last_cc_; }

  // Parser-owned offsets, carried across fragments of one manifest.
  double cc_offset = 0.0;
  double presentation_offset = 0.0;

  void Reset();

 private:
  std::map<int32_t, DiscontinuitySegment> segments_;
  int32_t last_cc_ = kNoDiscontinuity;
};

}  // namespace captionline::timeline

#endif  // CAPTIONLINE_TIMELINE_CONTINUITY_MAP_H_
