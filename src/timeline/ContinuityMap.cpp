// Repository: captionline
// Component: Continuity Map
// Purpose: Per-discontinuity rebasing state handed to the subtitle parser.
// Copyright (c) 2025 captionline authors

#include "captionline/timeline/ContinuityMap.h"

namespace captionline::timeline {

const DiscontinuitySegment& ContinuityMap::Rebase(int32_t cc, double fragment_start) {
  auto it = segments_.find(cc);
  if (it != segments_.end()) {
    return it->second;
  }

  DiscontinuitySegment segment;
  segment.base_start_time = fragment_start;
  segment.previous_discontinuity_id = last_cc_;
  segment.first_seen = true;
  last_cc_ = cc;
  return segments_.emplace(cc, segment).first->second;
}

const DiscontinuitySegment* ContinuityMap::Find(int32_t cc) const {
  auto it = segments_.find(cc);
  return it == segments_.end() ? nullptr : &it->second;
}

DiscontinuitySegment* ContinuityMap::Find(int32_t cc) {
  auto it = segments_.find(cc);
  return it == segments_.end() ? nullptr : &it->second;
}

void ContinuityMap::Reset() {
  segments_.clear();
  last_cc_ = kNoDiscontinuity;
  cc_offset = 0.0;
  presentation_offset = 0.0;
}

}  // namespace captionline::timeline
