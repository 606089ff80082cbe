// Repository: captionline
// Component: Discontinuity Sequencer
// Purpose: Detect gaps in main-stream fragment sequence numbers.
// Copyright (c) 2025 captionline authors

#include "captionline/timeline/DiscontinuitySequencer.h"

namespace captionline::timeline {

bool DiscontinuitySequencer::OnMainFragment(int64_t sn) {
  const bool gap = (sn != last_sn_ + 1);
  last_sn_ = sn;
  return gap;
}

}  // namespace captionline::timeline
