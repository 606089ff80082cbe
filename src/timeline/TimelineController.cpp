// Repository: captionline
// Component: Timeline Controller
// Purpose: Routes caption user-data and subtitle fragments onto text tracks.
// Copyright (c) 2025 captionline authors

#include "captionline/timeline/TimelineController.h"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "captionline/captions/BytePairDemuxer.h"
#include "captionline/events/IHostEventBus.h"
#include "captionline/subtitles/ISubtitleParser.h"
#include "captionline/util/Logger.hpp"

namespace captionline::timeline {

using util::Logger;

TimelineController::TimelineController(config::CaptionConfig config,
                                       std::shared_ptr<captions::ICaptionDecoder> caption_decoder,
                                       std::shared_ptr<subtitles::ISubtitleParser> subtitle_parser,
                                       std::shared_ptr<events::IHostEventBus> event_bus)
    : config_(std::move(config)),
      caption_decoder_(std::move(caption_decoder)),
      subtitle_parser_(std::move(subtitle_parser)),
      event_bus_(std::move(event_bus)),
      generation_(std::make_shared<uint64_t>(0)) {
  if (!event_bus_) {
    throw std::invalid_argument("TimelineController requires a host event bus");
  }
  if (config_.enable_cea708_captions && !caption_decoder_) {
    throw std::invalid_argument("TimelineController requires a caption decoder when captions are enabled");
  }
  if (config_.enable_webvtt && !subtitle_parser_) {
    throw std::invalid_argument("TimelineController requires a subtitle parser when WebVTT is enabled");
  }

  if (config_.enable_cea708_captions) {
    caption_decoder_->SetCueListener(this);
  }
}

TimelineController::~TimelineController() {
  if (caption_decoder_ && config_.enable_cea708_captions) {
    caption_decoder_->SetCueListener(nullptr);
  }
}

// ============================================================================
// Media / manifest lifecycle
// ============================================================================

void TimelineController::OnMediaAttaching(output::ITrackSink* sink) {
  sink_ = sink;
}

void TimelineController::OnMediaDetaching() {
  if (sink_) {
    for (const auto& track : caption_tracks_) {
      if (track.has_value()) {
        sink_->ClearCues(*track);
      }
    }
  }

  const size_t dropped = gate_.PendingCount();
  ResetAttachmentState();

  caption_tracks_.fill(std::nullopt);
  subtitle_tracks_.clear();
  sink_ = nullptr;

  std::ostringstream oss;
  oss << "[TimelineController] MEDIA_DETACHED pending_dropped=" << dropped;
  Logger::Info(oss.str());
}

void TimelineController::OnManifestLoading() {
  sequencer_.Reset();
  continuity_map_.Reset();

  // Cues from the previous presentation are outdated.
  if (sink_) {
    for (const auto& track : sink_->ListTracks()) {
      sink_->ClearCues(track.handle);
    }
  }
}

void TimelineController::OnManifestLoaded(const std::vector<SubtitleTrackInfo>& subtitle_tracks) {
  subtitle_tracks_.clear();
  ResetAttachmentState();

  if (!config_.enable_webvtt) {
    return;
  }
  if (!sink_) {
    std::ostringstream oss;
    oss << "[TimelineController] SUBTITLE_TRACKS_UNBOUND reason=no_media count="
        << subtitle_tracks.size();
    Logger::Warn(oss.str());
    return;
  }

  const std::vector<output::TrackInfo> in_use = sink_->ListTracks();
  for (size_t index = 0; index < subtitle_tracks.size(); ++index) {
    const SubtitleTrackInfo& manifest_track = subtitle_tracks[index];

    std::optional<output::TrackHandle> handle;
    if (index < in_use.size()) {
      const output::TrackInfo& candidate = in_use[index];
      // Reuse tracks with the same label, never a caption channel track.
      if (candidate.label == manifest_track.name && candidate.caption_channel == 0) {
        handle = candidate.handle;
      }
    }
    if (!handle.has_value()) {
      handle = sink_->CreateTrack(output::TrackKind::kSubtitles, manifest_track.name,
                                  manifest_track.lang);
    }
    const output::TrackMode mode =
        manifest_track.is_default ? output::TrackMode::kShowing : output::TrackMode::kHidden;
    sink_->SetTrackMode(*handle, mode);
    subtitle_tracks_.push_back(*handle);

    std::ostringstream oss;
    oss << "[TimelineController] SUBTITLE_TRACK_BOUND index=" << index << " track=" << *handle
        << " label=" << manifest_track.name << " mode=" << output::TrackModeName(mode);
    Logger::Info(oss.str());
  }
}

void TimelineController::OnLevelSwitching(bool level_has_closed_captions) {
  captions_enabled_ = level_has_closed_captions;
}

void TimelineController::ResetAttachmentState() {
  gate_.Reset();
  continuity_map_.Reset();
  overlap_resolver_.Reset();
  // Outstanding parse completions now belong to a dead generation.
  ++(*generation_);
}

// ============================================================================
// Fragments
// ============================================================================

void TimelineController::OnFragLoaded(const FragmentInfo& fragment, Payload payload) {
  if (fragment.type == FragmentType::kMain) {
    // A non-contiguous fragment would leave half-decoded control codes in the
    // caption decoder and produce cues with bad start/end times.
    if (sequencer_.OnMainFragment(fragment.sn) && CaptionPathActive()) {
      caption_decoder_->Reset();
      stats_.decoder_resets++;
      std::ostringstream oss;
      oss << "[TimelineController] CAPTION_DECODER_RESET sn=" << fragment.sn;
      Logger::Debug(oss.str());
    }
    return;
  }

  if (fragment.type != FragmentType::kSubtitle) {
    std::ostringstream oss;
    oss << "[TimelineController] FRAGMENT_IGNORED type=" << FragmentTypeName(fragment.type)
        << " sn=" << fragment.sn;
    Logger::Debug(oss.str());
    return;
  }

  if (payload.empty()) {
    std::ostringstream oss;
    oss << "[TimelineController] SUBTITLE_FRAGMENT_EMPTY sn=" << fragment.sn
        << " track_id=" << fragment.track_id;
    Logger::Warn(oss.str());
    stats_.subtitle_fragments_failed++;
    PublishFragmentProcessed(fragment, false);
    return;
  }

  if (gate_.Admit(fragment, std::move(payload)) == GateDecision::kDeferred) {
    stats_.subtitle_fragments_deferred++;
    std::ostringstream oss;
    oss << "[TimelineController] SUBTITLE_FRAGMENT_DEFERRED sn=" << fragment.sn
        << " pending=" << gate_.PendingCount();
    Logger::Debug(oss.str());
    return;
  }

  // Admit() only moves from `payload` when it defers.
  ProcessSubtitleFragment(fragment, payload);
}

void TimelineController::OnInitPtsFound(int64_t init_pts) {
  const bool first = !gate_.HasReference();
  std::vector<PendingFragment> released = gate_.OnReferenceTimestampDiscovered(init_pts);

  if (first) {
    std::ostringstream oss;
    oss << "[TimelineController] REFERENCE_PTS_SET init_pts=" << init_pts
        << " replaying=" << released.size();
    Logger::Info(oss.str());
  }

  // A host handler may detach or reload from inside the replay; fragments of
  // the discarded generation are dropped with it.
  const uint64_t generation = *generation_;
  for (size_t i = 0; i < released.size(); ++i) {
    if (*generation_ != generation) {
      std::ostringstream oss;
      oss << "[TimelineController] REPLAY_ABANDONED dropped=" << (released.size() - i);
      Logger::Info(oss.str());
      return;
    }
    ProcessSubtitleFragment(released[i].fragment, released[i].payload);
  }
}

void TimelineController::ProcessSubtitleFragment(const FragmentInfo& fragment,
                                                 const Payload& payload) {
  if (!subtitle_parser_ || !config_.enable_webvtt) {
    std::ostringstream oss;
    oss << "[TimelineController] SUBTITLE_FRAGMENT_SKIPPED sn=" << fragment.sn
        << " reason=webvtt_disabled";
    Logger::Warn(oss.str());
    stats_.subtitle_fragments_failed++;
    PublishFragmentProcessed(fragment, false);
    return;
  }

  if (!gate_.HasReference()) {
    std::ostringstream oss;
    oss << "[TimelineController] SUBTITLE_FRAGMENT_UNGATED sn=" << fragment.sn
        << " reason=no_reference_pts";
    Logger::Error(oss.str());
    return;
  }

  continuity_map_.Rebase(fragment.cc, fragment.start);

  std::weak_ptr<uint64_t> generation_ref = generation_;
  const uint64_t generation = *generation_;

  auto is_current = [this, generation_ref, generation]() {
    auto current = generation_ref.lock();
    if (!current) {
      return false;  // Controller destroyed
    }
    if (*current != generation) {
      stats_.stale_parse_completions++;
      return false;
    }
    return true;
  };

  subtitle_parser_->Parse(
      payload, *gate_.ReferenceTimestamp(), continuity_map_, fragment.cc,
      [this, fragment, is_current](std::vector<Cue> cues) {
        if (!is_current()) return;
        OnSubtitleCuesParsed(fragment, std::move(cues));
      },
      [this, fragment, is_current](const std::string& reason) {
        if (!is_current()) return;
        OnSubtitleParseFailed(fragment, reason);
      });
}

void TimelineController::OnSubtitleCuesParsed(const FragmentInfo& fragment,
                                              std::vector<Cue> cues) {
  if (!sink_ || fragment.track_id < 0 ||
      static_cast<size_t>(fragment.track_id) >= subtitle_tracks_.size()) {
    std::ostringstream oss;
    oss << "[TimelineController] SUBTITLE_TRACK_MISSING sn=" << fragment.sn
        << " track_id=" << fragment.track_id << " tracks=" << subtitle_tracks_.size();
    Logger::Warn(oss.str());
    stats_.subtitle_fragments_failed++;
    PublishFragmentProcessed(fragment, false);
    return;
  }

  const output::TrackHandle track = subtitle_tracks_[static_cast<size_t>(fragment.track_id)];
  for (auto& cue : cues) {
    // Segmented subtitle files repeat cues that straddle fragment boundaries.
    if (sink_->FindCueById(track, cue.id).has_value()) {
      stats_.subtitle_cues_duplicate++;
      continue;
    }
    if (sink_->AddCue(track, cue)) {
      stats_.subtitle_cues_added++;
    }
  }
  PublishFragmentProcessed(fragment, true);
}

void TimelineController::OnSubtitleParseFailed(const FragmentInfo& fragment,
                                               const std::string& reason) {
  std::ostringstream oss;
  oss << "[TimelineController] SUBTITLE_PARSE_FAILED sn=" << fragment.sn
      << " cc=" << fragment.cc << " reason=" << reason;
  Logger::Warn(oss.str());
  stats_.subtitle_fragments_failed++;
  PublishFragmentProcessed(fragment, false);
}

void TimelineController::PublishFragmentProcessed(const FragmentInfo& fragment, bool success) {
  events::SubtitleFragmentProcessed event;
  event.success = success;
  event.fragment = fragment;
  event_bus_->PublishSubtitleFragmentProcessed(event);
}

// ============================================================================
// Embedded captions
// ============================================================================

bool TimelineController::CaptionPathActive() const {
  return config_.enable_cea708_captions && caption_decoder_ != nullptr;
}

void TimelineController::OnFragParsingUserdata(const std::vector<UserdataSample>& samples) {
  if (!captions_enabled_ || !CaptionPathActive()) {
    return;
  }

  for (const auto& sample : samples) {
    captions::DemuxResult result = captions::BytePairDemuxer::Extract(sample.bytes);
    if (!result.ok()) {
      stats_.samples_rejected++;
      std::ostringstream oss;
      oss << "[TimelineController] USERDATA_SAMPLE_REJECTED pts=" << sample.pts
          << " status=" << captions::DemuxStatusName(result.status)
          << " size=" << sample.bytes.size()
          << " declared_triplets=" << result.triplets_declared;
      Logger::Warn(oss.str());
      continue;
    }
    caption_decoder_->AddData(sample.pts, result.pairs);
  }
}

std::optional<output::TrackHandle> TimelineController::CaptionTrack(
    captions::CaptionChannel channel) const {
  const int32_t index = captions::ChannelIndex(channel);
  if (index < 0 || index >= captions::kCaptionChannelCount) {
    return std::nullopt;
  }
  return caption_tracks_[static_cast<size_t>(index)];
}

output::TrackHandle TimelineController::EnsureCaptionTrack(captions::CaptionChannel channel) {
  const size_t index = static_cast<size_t>(captions::ChannelIndex(channel));
  if (caption_tracks_[index].has_value()) {
    return *caption_tracks_[index];
  }

  const int32_t channel_number = static_cast<int32_t>(channel);

  // Reuse the track a previous attachment bound to this channel.
  for (const auto& track : sink_->ListTracks()) {
    if (track.caption_channel == channel_number) {
      caption_tracks_[index] = track.handle;
      sink_->ClearCues(track.handle);
      sink_->AnnounceTrack(track.handle);
      std::ostringstream oss;
      oss << "[TimelineController] CAPTION_TRACK_REUSED channel=" << channel_number
          << " track=" << track.handle;
      Logger::Info(oss.str());
      return track.handle;
    }
  }

  const bool first_channel = (channel == captions::CaptionChannel::kChannel1);
  const std::string& label = first_channel ? config_.captions_text_track1_label
                                           : config_.captions_text_track2_label;
  const std::string& language = first_channel ? config_.captions_text_track1_language_code
                                              : config_.captions_text_track2_language_code;
  const output::TrackHandle handle =
      sink_->CreateTrack(output::TrackKind::kCaptions, label, language);
  sink_->TagCaptionChannel(handle, channel_number);
  caption_tracks_[index] = handle;

  std::ostringstream oss;
  oss << "[TimelineController] CAPTION_TRACK_CREATED channel=" << channel_number
      << " track=" << handle << " label=" << label << " lang=" << language;
  Logger::Info(oss.str());
  return handle;
}

void TimelineController::OnNewCue(captions::CaptionChannel channel,
                                  double start_time,
                                  double end_time,
                                  const captions::CaptionScreen& screen) {
  const int32_t index = captions::ChannelIndex(channel);
  if (index < 0 || index >= captions::kCaptionChannelCount) {
    std::ostringstream oss;
    oss << "[TimelineController] CAPTION_CUE_BAD_CHANNEL channel=" << static_cast<int32_t>(channel);
    Logger::Error(oss.str());
    return;
  }
  if (!sink_) {
    std::ostringstream oss;
    oss << "[TimelineController] CAPTION_CUE_UNBOUND reason=no_media start=" << start_time
        << " end=" << end_time;
    Logger::Debug(oss.str());
    return;
  }

  const output::TrackHandle track = EnsureCaptionTrack(channel);

  // Skip cues which overlap more than 50% with previously emitted ranges.
  const OverlapAction action = overlap_resolver_.Submit(start_time, end_time);
  {
    std::ostringstream oss;
    oss << "[TimelineController] CAPTION_CUE channel=" << static_cast<int32_t>(channel)
        << " start=" << start_time << " end=" << end_time
        << " action=" << OverlapActionName(action);
    Logger::Debug(oss.str());
  }
  if (action == OverlapAction::kDrop) {
    stats_.caption_cues_dropped++;
    return;
  }
  if (action == OverlapAction::kForwardAfterMerge) {
    stats_.caption_cues_merged++;
  }
  stats_.caption_cues_forwarded++;

  Cue cue;
  cue.id = "cc" + std::to_string(static_cast<int32_t>(channel)) + "-" +
           std::to_string(next_caption_cue_seq_++);
  cue.start_time = start_time;
  cue.end_time = end_time;
  cue.payload = screen.ToText();
  sink_->AddCue(track, cue);
}

}  // namespace captionline::timeline
