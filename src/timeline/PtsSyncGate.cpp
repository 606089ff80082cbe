// Repository: captionline
// Component: PTS Synchronization Gate
// Purpose: Park subtitle fragments until the stream reference PTS is known.
// Copyright (c) 2025 captionline authors

#include "captionline/timeline/PtsSyncGate.h"

#include <iterator>
#include <utility>

namespace captionline::timeline {

GateDecision PtsSyncGate::Admit(const FragmentInfo& fragment, Payload&& payload) {
  if (reference_pts_.has_value()) {
    return GateDecision::kProcessNow;
  }
  pending_.push_back(PendingFragment{fragment, std::move(payload)});
  return GateDecision::kDeferred;
}

std::vector<PendingFragment> PtsSyncGate::OnReferenceTimestampDiscovered(
    int64_t reference_pts) {
  if (reference_pts_.has_value()) {
    return {};
  }
  reference_pts_ = reference_pts;

  std::vector<PendingFragment> released(std::make_move_iterator(pending_.begin()),
                                        std::make_move_iterator(pending_.end()));
  pending_.clear();
  return released;
}

void PtsSyncGate::Reset() {
  reference_pts_ = std::nullopt;
  pending_.clear();
}

}  // namespace captionline::timeline
