// Repository: captionline
// Component: In-Memory Track Sink
// Purpose: ITrackSink backed by plain containers (tools, headless hosts, tests).
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_OUTPUT_IN_MEMORY_TRACK_SINK_H_
#define CAPTIONLINE_OUTPUT_IN_MEMORY_TRACK_SINK_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "captionline/output/ITrackSink.h"

namespace captionline::output {

// InMemoryTrackSink keeps tracks and their cues in memory.
//
// Cues are kept in insertion order; AddCue() does not deduplicate, so two
// cues with the same id are both stored. Unknown handles are ignored
// (AddCue returns false).
class InMemoryTrackSink : public ITrackSink {
 public:
  InMemoryTrackSink() = default;
  ~InMemoryTrackSink() override = default;

  InMemoryTrackSink(const InMemoryTrackSink&) = delete;
  InMemoryTrackSink& operator=(const InMemoryTrackSink&) = delete;

  // ITrackSink
  TrackHandle CreateTrack(TrackKind kind,
                          const std::string& label,
                          const std::string& language) override;
  std::vector<TrackInfo> ListTracks() const override;
  void SetTrackMode(TrackHandle track, TrackMode mode) override;
  void TagCaptionChannel(TrackHandle track, int32_t channel) override;
  void AnnounceTrack(TrackHandle track) override;
  void ClearCues(TrackHandle track) override;
  bool AddCue(TrackHandle track, const timeline::Cue& cue) override;
  std::optional<timeline::Cue> FindCueById(TrackHandle track,
                                           const std::string& id) const override;

  // Inspection helpers

  std::optional<TrackInfo> GetTrack(TrackHandle track) const;

  // Cues of `track` in insertion order (empty for unknown handles).
  std::vector<timeline::Cue> GetCues(TrackHandle track) const;

  size_t CueCount(TrackHandle track) const;
  size_t TrackCount() const { return order_.size(); }

  // Number of AnnounceTrack() calls for `track`.
  uint64_t AnnounceCount(TrackHandle track) const;

  // Number of ClearCues() calls for `track`.
  uint64_t ClearCount(TrackHandle track) const;

 private:
  struct TrackState {
    TrackInfo info;
    std::vector<timeline::Cue> cues;
    uint64_t announce_count = 0;
    uint64_t clear_count = 0;
  };

  TrackState* Lookup(TrackHandle track);
  const TrackState* Lookup(TrackHandle track) const;

  std::map<TrackHandle, TrackState> tracks_;
  std::vector<TrackHandle> order_;
  TrackHandle next_handle_ = 1;
};

}  // namespace captionline::output

#endif  // CAPTIONLINE_OUTPUT_IN_MEMORY_TRACK_SINK_H_
