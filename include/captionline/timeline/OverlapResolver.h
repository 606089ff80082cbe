// Repository: captionline
// Component: Overlap Resolver
// Purpose: Merge or suppress caption cues that re-cover already emitted time.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_TIMELINE_OVERLAP_RESOLVER_H_
#define CAPTIONLINE_TIMELINE_OVERLAP_RESOLVER_H_

#include <cstddef>
#include <vector>

#include "captionline/timeline/TimelineTypes.h"

namespace captionline::timeline {

// CueRangeStore holds the time ranges already covered by emitted caption
// cues, in insertion order. All caption channels share one store.
// Ranges may overlap each other; no ordering is maintained.
class CueRangeStore {
 public:
  size_t Size() const { return ranges_.size(); }
  bool Empty() const { return ranges_.empty(); }

  const CueRange& At(size_t index) const { return ranges_.at(index); }
  CueRange& At(size_t index) { return ranges_.at(index); }

  void Append(const CueRange& range) { ranges_.push_back(range); }
  void Clear() { ranges_.clear(); }


 private:
  std::vector<CueRange> ranges_;
};

// Outcome of submitting a candidate cue.
enum class OverlapAction {
  kForward,             // No stored range touched; candidate stored as new range
  kForwardAfterMerge,   // Widened one or more ranges, overlap ratio stayed <= 0.5
  kDrop                 // A range covers more than half the candidate
};

const char* OverlapActionName(OverlapAction action);

// OverlapResolver decides whether a caption cue is new or a re-parse of a
// cue already emitted from an overlapping fragment.
//
// Submit() walks the store from the most recently added range backwards.
// Every range with a non-negative intersection is widened to the union with
// the candidate. If the intersection exceeds half the candidate's duration
// the walk stops and the candidate is dropped; the widening already applied
// to that range is kept. A ratio of exactly 0.5 does not drop.
class OverlapResolver {
 public:
  static constexpr double kDropRatio = 0.5;

  OverlapResolver() = default;

  OverlapResolver(const OverlapResolver&) = delete;
  OverlapResolver& operator=(const OverlapResolver&) = delete;

  OverlapAction Submit(double start_time, double end_time);
  OverlapAction Submit(const CueRange& candidate) {
    return Submit(candidate.start, candidate.end);
  }

  // Forget all ranges (manifest load / media detach).
  void Reset() { store_.Clear(); }

  const CueRangeStore& Store() const { return store_; }

 private:
  CueRangeStore store_;
};

}  // namespace captionline::timeline

#endif  // CAPTIONLINE_TIMELINE_OVERLAP_RESOLVER_H_
