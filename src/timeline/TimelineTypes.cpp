// Repository: captionline
// Component: Timeline Types
// Purpose: Name helpers for timeline value types.
// Copyright (c) 2025 captionline authors

#include "captionline/timeline/TimelineTypes.h"

namespace captionline::timeline {

const char* FragmentTypeName(FragmentType type) {
  switch (type) {
    case FragmentType::kMain:
      return "main";
    case FragmentType::kAudio:
      return "audio";
    case FragmentType::kSubtitle:
      return "subtitle";
  }
  return "unknown";
}

}  // namespace captionline::timeline
