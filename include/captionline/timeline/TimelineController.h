// Repository: captionline
// Component: Timeline Controller
// Purpose: Routes caption user-data and subtitle fragments onto text tracks.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_TIMELINE_TIMELINE_CONTROLLER_H_
#define CAPTIONLINE_TIMELINE_TIMELINE_CONTROLLER_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "captionline/captions/CaptionTypes.h"
#include "captionline/captions/ICaptionDecoder.h"
#include "captionline/config/CaptionConfig.h"
#include "captionline/output/ITrackSink.h"
#include "captionline/timeline/ContinuityMap.h"
#include "captionline/timeline/DiscontinuitySequencer.h"
#include "captionline/timeline/OverlapResolver.h"
#include "captionline/timeline/PtsSyncGate.h"
#include "captionline/timeline/TimelineTypes.h"

namespace captionline::events {
class IHostEventBus;
}  // namespace captionline::events

namespace captionline::subtitles {
class ISubtitleParser;
}  // namespace captionline::subtitles

namespace captionline::timeline {

// TimelineController turns the host player's fragment and user-data events
// into deduplicated cues on the media element's text tracks.
//
// Responsibilities:
// - Reset the caption decoder when main fragments stop being contiguous
// - Demultiplex line-21 byte pairs out of user-data samples
// - Drop or merge caption cues that re-cover already emitted time
// - Park subtitle fragments until the initial PTS of the stream is known
// - Keep per-discontinuity rebasing state for the subtitle parser
// - Add parsed subtitle cues whose id is not yet on the track
// - Publish one SubtitleFragmentProcessed per subtitle fragment
//
// Threading: all entry points, and the parser completion callbacks, must be
// delivered from the host's single event loop. There is no internal locking.
//
// Lifetime: a parse completion that arrives after OnMediaDetaching(),
// OnManifestLoaded() or destruction of the controller is discarded.
class TimelineController : public captions::ICaptionCueListener {
 public:
  // `caption_decoder` is required when config.enable_cea708_captions is set,
  // `subtitle_parser` when config.enable_webvtt is set. `event_bus` is always
  // required. Throws std::invalid_argument otherwise.
  TimelineController(config::CaptionConfig config,
                     std::shared_ptr<captions::ICaptionDecoder> caption_decoder,
                     std::shared_ptr<subtitles::ISubtitleParser> subtitle_parser,
                     std::shared_ptr<events::IHostEventBus> event_bus);
  ~TimelineController() override;

  // Disable copy/move
  TimelineController(const TimelineController&) = delete;
  TimelineController& operator=(const TimelineController&) = delete;

  // ========================================================================
  // Host events
  // ========================================================================

  // Binds the media element's track list. Non-owning; must outlive the
  // binding (until OnMediaDetaching or destruction).
  void OnMediaAttaching(output::ITrackSink* sink);

  // Clears caption track cues and drops every piece of per-attachment state:
  // parked fragments, reference PTS, continuity map and cue ranges.
  void OnMediaDetaching();

  // Restores the sequence sentinel, resets the continuity map and clears the
  // cues of every track on the sink.
  void OnManifestLoading();

  // Resets per-manifest timing state and binds one subtitle track per
  // manifest rendition (reusing same-label tracks at the same index).
  void OnManifestLoaded(const std::vector<SubtitleTrackInfo>& subtitle_tracks);

  // Caption data is only consumed while the current level carries captions.
  void OnLevelSwitching(bool level_has_closed_captions);

  void OnFragLoaded(const FragmentInfo& fragment, Payload payload);

  void OnFragParsingUserdata(const std::vector<UserdataSample>& samples);

  // Initial PTS of the main stream (90 kHz ticks). First value wins.
  void OnInitPtsFound(int64_t init_pts);

  // ========================================================================
  // ICaptionCueListener (called by the caption decoder from AddData)
  // ========================================================================

  void OnNewCue(captions::CaptionChannel channel,
                double start_time,
                double end_time,
                const captions::CaptionScreen& screen) override;

  // ========================================================================
  // State (read-only)
  // ========================================================================

  std::optional<int64_t> ReferenceTimestamp() const { return gate_.ReferenceTimestamp(); }
  size_t PendingSubtitleFragments() const { return gate_.PendingCount(); }
  const ContinuityMap& GetContinuityMap() const { return continuity_map_; }
  const CueRangeStore& GetCueRanges() const { return overlap_resolver_.Store(); }
  int64_t LastMainSequenceNumber() const { return sequencer_.LastSequenceNumber(); }
  bool CaptionsEnabled() const { return captions_enabled_; }

  // Track bound to a caption channel, if a cue was already emitted on it.
  std::optional<output::TrackHandle> CaptionTrack(captions::CaptionChannel channel) const;

  // Subtitle tracks indexed by FragmentInfo::track_id.
  const std::vector<output::TrackHandle>& SubtitleTracks() const { return subtitle_tracks_; }

  const config::CaptionConfig& GetConfig() const { return config_; }

  // ========================================================================
  // Statistics
  // ========================================================================

  struct Stats {
    uint64_t decoder_resets = 0;
    uint64_t samples_rejected = 0;          // Malformed user-data samples
    uint64_t caption_cues_forwarded = 0;    // Includes forwarded-after-merge
    uint64_t caption_cues_merged = 0;       // Forwarded after widening a range
    uint64_t caption_cues_dropped = 0;
    uint64_t subtitle_fragments_deferred = 0;
    uint64_t subtitle_fragments_failed = 0;
    uint64_t subtitle_cues_added = 0;
    uint64_t subtitle_cues_duplicate = 0;
    uint64_t stale_parse_completions = 0;
  };

  Stats GetStats() const { return stats_; }
  void ResetStats() { stats_ = Stats(); }

 private:
  // Rebases and hands one admitted subtitle fragment to the parser.
  void ProcessSubtitleFragment(const FragmentInfo& fragment, const Payload& payload);

  void OnSubtitleCuesParsed(const FragmentInfo& fragment, std::vector<Cue> cues);
  void OnSubtitleParseFailed(const FragmentInfo& fragment, const std::string& reason);

  void PublishFragmentProcessed(const FragmentInfo& fragment, bool success);

  // Binds (reusing a tagged track or creating one) the track for `channel`.
  output::TrackHandle EnsureCaptionTrack(captions::CaptionChannel channel);

  // Drops parked fragments, reference PTS, continuity map and cue ranges and
  // invalidates in-flight parse completions.
  void ResetAttachmentState();

  bool CaptionPathActive() const;

  config::CaptionConfig config_;
  std::shared_ptr<captions::ICaptionDecoder> caption_decoder_;
  std::shared_ptr<subtitles::ISubtitleParser> subtitle_parser_;
  std::shared_ptr<events::IHostEventBus> event_bus_;

  output::ITrackSink* sink_ = nullptr;

  DiscontinuitySequencer sequencer_;
  PtsSyncGate gate_;
  ContinuityMap continuity_map_;
  OverlapResolver overlap_resolver_;

  bool captions_enabled_ = true;

  std::array<std::optional<output::TrackHandle>, captions::kCaptionChannelCount> caption_tracks_;
  std::vector<output::TrackHandle> subtitle_tracks_;
  uint64_t next_caption_cue_seq_ = 0;

  // Shared with parse completions; bumped whenever attachment/manifest state
  // is discarded. Expires with the controller.
  std::shared_ptr<uint64_t> generation_;

  Stats stats_;
};

}  // namespace captionline::timeline

#endif  // CAPTIONLINE_TIMELINE_TIMELINE_CONTROLLER_H_
