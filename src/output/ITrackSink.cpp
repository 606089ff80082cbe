// Repository: captionline
// Component: ITrackSink Interface
// Purpose: Name helpers for track kinds and modes.
// Copyright (c) 2025 captionline authors

#include "captionline/output/ITrackSink.h"

namespace captionline::output {

const char* TrackKindName(TrackKind kind) {
  switch (kind) {
    case TrackKind::kCaptions:
      return "captions";
    case TrackKind::kSubtitles:
      return "subtitles";
  }
  return "unknown";
}

const char* TrackModeName(TrackMode mode) {
  switch (mode) {
    case TrackMode::kDisabled:
      return "disabled";
    case TrackMode::kHidden:
      return "hidden";
    case TrackMode::kShowing:
      return "showing";
  }
  return "unknown";
}

}  // namespace captionline::output
