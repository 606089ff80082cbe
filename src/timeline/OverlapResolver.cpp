// Repository: captionline
// Component: Overlap Resolver
// Purpose: Merge or suppress caption cues that re-cover already emitted time.
// Copyright (c) 2025 captionline authors

#include "captionline/timeline/OverlapResolver.h"

#include <algorithm>

namespace captionline::timeline {

namespace {

double Intersection(double x1, double x2, double y1, double y2) {
  return std::min(x2, y2) - std::max(x1, y1);
}

}  // namespace

const char* OverlapActionName(OverlapAction action) {
  switch (action) {
    case OverlapAction::kForward:
      return "forward";
    case OverlapAction::kForwardAfterMerge:
      return "forward_after_merge";
    case OverlapAction::kDrop:
      return "drop";
  }
  return "unknown";
}

OverlapAction OverlapResolver::Submit(double start_time, double end_time) {
  const double duration = end_time - start_time;
  bool merged = false;

  // Index-based reverse walk; ranges are updated in place and never
  // inserted or removed during the walk.
  for (size_t i = store_.Size(); i-- > 0;) {
    CueRange& range = store_.At(i);
    const double overlap = Intersection(range.start, range.end, start_time, end_time);
    if (overlap >= 0) {
      range.start = std::min(range.start, start_time);
      range.end = std::max(range.end, end_time);
      merged = true;
      if ((overlap / duration) > kDropRatio) {
        return OverlapAction::kDrop;
      }
    }
  }

  if (!merged) {
    store_.Append(CueRange{start_time, end_time});
    return OverlapAction::kForward;
  }
  return OverlapAction::kForwardAfterMerge;
}

}  // namespace captionline::timeline
