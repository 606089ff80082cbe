// Repository: captionline
// Component: Timeline Types
// Purpose: Value types shared by the caption/subtitle timeline components.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_TIMELINE_TIMELINE_TYPES_H_
#define CAPTIONLINE_TIMELINE_TIMELINE_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>

namespace captionline::timeline {

// Raw fragment bytes as delivered by the fragment loader.
using Payload = std::vector<uint8_t>;

// Which playlist a loaded fragment belongs to.
enum class FragmentType {
  kMain,
  kAudio,
  kSubtitle
};

const char* FragmentTypeName(FragmentType type);

// Metadata of a loaded fragment. Times are in seconds.
struct FragmentInfo {
  FragmentType type = FragmentType::kMain;
  int64_t sn = 0;         // Media sequence number
  int32_t cc = 0;         // Discontinuity id
  double start = 0.0;     // Fragment start on the media timeline
  double duration = 0.0;
  int32_t track_id = 0;   // Subtitle track index (subtitle fragments only)
  int32_t level = 0;
};

// A subtitle fragment parked until the reference timestamp is known.
struct PendingFragment {
  FragmentInfo fragment;
  Payload payload;
};

// Time span [start, end] in seconds already covered by emitted caption cues.
struct CueRange {
  double start = 0.0;
  double end = 0.0;
};

// A timed text entry. Identity is `id`.
struct Cue {
  std::string id;
  double start_time = 0.0;
  double end_time = 0.0;
  std::string payload;
};

// One user-data sample attached to a video frame (e.g. ATSC A/53 cc_data).
struct UserdataSample {
  double pts = 0.0;  // Presentation time in seconds
  std::vector<uint8_t> bytes;
};

// Subtitle rendition advertised by the manifest.
struct SubtitleTrackInfo {
  std::string name;
  std::string lang;
  bool is_default = false;
};

}  // namespace captionline::timeline

#endif  // CAPTIONLINE_TIMELINE_TIMELINE_TYPES_H_
