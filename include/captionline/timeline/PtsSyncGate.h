// Repository: captionline
// Component: PTS Synchronization Gate
// Purpose: Park subtitle fragments until the stream reference PTS is known.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_TIMELINE_PTS_SYNC_GATE_H_
#define CAPTIONLINE_TIMELINE_PTS_SYNC_GATE_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "captionline/timeline/TimelineTypes.h"

namespace captionline::timeline {

enum class GateDecision {
  kProcessNow,  // Reference known; caller processes the fragment immediately
  kDeferred     // Queued; returned later by OnReferenceTimestampDiscovered()
};

// PtsSyncGate holds subtitle fragments that arrive before the stream-wide
// reference timestamp (initial PTS of the main stream). Subtitle and main
// loaders run independently, so subtitle data may land first.
//
// The reference is write-once. The queue is released exactly once, in
// arrival order, on the first OnReferenceTimestampDiscovered() call. There is
// no timeout: without a reference, fragments stay parked until Reset().
class PtsSyncGate {
 public:
  PtsSyncGate() = default;

  PtsSyncGate(const PtsSyncGate&) = delete;
  PtsSyncGate& operator=(const PtsSyncGate&) = delete;

  // Returns kDeferred while the reference is unset; the payload is moved
  // into the queue only in that case.
  GateDecision Admit(const FragmentInfo& fragment, Payload&& payload);

  // Sets the reference if unset and returns the parked fragments in arrival
  // order. Returns an empty list when the reference was already set.
  std::vector<PendingFragment> OnReferenceTimestampDiscovered(int64_t reference_pts);

  std::optional<int64_t> ReferenceTimestamp() const { return reference_pts_; }
  bool HasReference() const { return reference_pts_.has_value(); }
  size_t PendingCount() const { return pending_.size(); }

  // Drops parked fragments and forgets the reference.
  void Reset();

 private:
  std::optional<int64_t> reference_pts_;
  std::deque<PendingFragment> pending_;
};

}  // namespace captionline::timeline

#endif  // CAPTIONLINE_TIMELINE_PTS_SYNC_GATE_H_
