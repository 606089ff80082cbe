// Repository: captionline
// Component: ITrackSink Interface
// Purpose: Platform text-track collection that receives cues.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_OUTPUT_ITRACK_SINK_H_
#define CAPTIONLINE_OUTPUT_ITRACK_SINK_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "captionline/timeline/TimelineTypes.h"

namespace captionline::output {

using TrackHandle = uint32_t;

enum class TrackKind {
  kCaptions,
  kSubtitles
};

enum class TrackMode {
  kDisabled,
  kHidden,
  kShowing
};

const char* TrackKindName(TrackKind kind);
const char* TrackModeName(TrackMode mode);

// Snapshot of one track as listed by the sink.
struct TrackInfo {
  TrackHandle handle = 0;
  TrackKind kind = TrackKind::kSubtitles;
  std::string label;
  std::string language;
  TrackMode mode = TrackMode::kDisabled;
  // 1 or 2 when the track was tagged as a CEA-608 channel track, 0 otherwise.
  int32_t caption_channel = 0;
};

// ITrackSink is the media element's text-track list.
//
// The sink owns tracks and cues; the timeline controller only holds handles.
// Tracks outlive media attach/detach so they can be reused by label or
// caption channel on the next attachment.
//
// ITrackSink explicitly does NOT:
// - Render or style cues
// - Deduplicate cues (callers check FindCueById first)
class ITrackSink {
 public:
  virtual ~ITrackSink() = default;

  virtual TrackHandle CreateTrack(TrackKind kind,
                                  const std::string& label,
                                  const std::string& language) = 0;

  // Tracks in creation order.
  virtual std::vector<TrackInfo> ListTracks() const = 0;

  virtual void SetTrackMode(TrackHandle track, TrackMode mode) = 0;

  // Marks `track` as the binding for a caption channel (1 or 2).
  virtual void TagCaptionChannel(TrackHandle track, int32_t channel) = 0;

  // Re-announces an existing track to the platform (track-added event).
  virtual void AnnounceTrack(TrackHandle track) = 0;

  virtual void ClearCues(TrackHandle track) = 0;

  // Returns false if the track does not exist.
  virtual bool AddCue(TrackHandle track, const timeline::Cue& cue) = 0;

  virtual std::optional<timeline::Cue> FindCueById(TrackHandle track,
                                                   const std::string& id) const = 0;
};

}  // namespace captionline::output

#endif  // CAPTIONLINE_OUTPUT_ITRACK_SINK_H_
