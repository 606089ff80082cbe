// Repository: captionline
// Component: In-Memory Track Sink
// Purpose: ITrackSink backed by plain containers (tools, headless hosts, tests).
// Copyright (c) 2025 captionline authors

#include "captionline/output/InMemoryTrackSink.h"

#include <utility>

namespace captionline::output {

InMemoryTrackSink::TrackState* InMemoryTrackSink::Lookup(TrackHandle track) {
  auto it = tracks_.find(track);
  return it == tracks_.end() ? nullptr : &it->second;
}

const InMemoryTrackSink::TrackState* InMemoryTrackSink::Lookup(TrackHandle track) const {
  auto it = tracks_.find(track);
  return it == tracks_.end() ? nullptr : &it->second;
}

TrackHandle InMemoryTrackSink::CreateTrack(TrackKind kind,
                                           const std::string& label,
                                           const std::string& language) {
  const TrackHandle handle = next_handle_++;
  TrackState state;
  state.info.handle = handle;
  state.info.kind = kind;
  state.info.label = label;
  state.info.language = language;
  // Newly added text tracks start hidden, like a media element's addTextTrack.
  state.info.mode = TrackMode::kHidden;
  tracks_.emplace(handle, std::move(state));
  order_.push_back(handle);
  return handle;
}

std::vector<TrackInfo> InMemoryTrackSink::ListTracks() const {
  std::vector<TrackInfo> out;
  out.reserve(order_.size());
  for (TrackHandle handle : order_) {
    out.push_back(tracks_.at(handle).info);
  }
  return out;
}

void InMemoryTrackSink::SetTrackMode(TrackHandle track, TrackMode mode) {
  if (auto* state = Lookup(track)) {
    state->info.mode = mode;
  }
}

void InMemoryTrackSink::TagCaptionChannel(TrackHandle track, int32_t channel) {
  if (auto* state = Lookup(track)) {
    state->info.caption_channel = channel;
  }
}

void InMemoryTrackSink::AnnounceTrack(TrackHandle track) {
  if (auto* state = Lookup(track)) {
    state->announce_count++;
  }
}

void InMemoryTrackSink::ClearCues(TrackHandle track) {
  if (auto* state = Lookup(track)) {
    state->cues.clear();
    state->clear_count++;
  }
}

bool InMemoryTrackSink::AddCue(TrackHandle track, const timeline::Cue& cue) {
  auto* state = Lookup(track);
  if (!state) {
    return false;
  }
  state->cues.push_back(cue);
  return true;
}

std::optional<timeline::Cue> InMemoryTrackSink::FindCueById(TrackHandle track,
                                                            const std::string& id) const {
  const auto* state = Lookup(track);
  if (!state) {
    return std::nullopt;
  }
  for (const auto& cue : state->cues) {
    if (cue.id == id) {
      return cue;
    }
  }
  return std::nullopt;
}

std::optional<TrackInfo> InMemoryTrackSink::GetTrack(TrackHandle track) const {
  const auto* state = Lookup(track);
  if (!state) {
    return std::nullopt;
  }
  return state->info;
}

std::vector<timeline::Cue> InMemoryTrackSink::GetCues(TrackHandle track) const {
  const auto* state = Lookup(track);
  return state ? state->cues : std::vector<timeline::Cue>{};
}

size_t InMemoryTrackSink::CueCount(TrackHandle track) const {
  const auto* state = Lookup(track);
  return state ? state->cues.size() : 0;
}

uint64_t InMemoryTrackSink::AnnounceCount(TrackHandle track) const {
  const auto* state = Lookup(track);
  return state ? state->announce_count : 0;
}

uint64_t InMemoryTrackSink::ClearCount(TrackHandle track) const {
  const auto* state = Lookup(track);
  return state ? state->clear_count : 0;
}

}  // namespace captionline::output
