// Repository: captionline
// Component: IHostEventBus Interface
// Purpose: Notifications produced by the timeline controller for its host.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_EVENTS_IHOST_EVENT_BUS_H_
#define CAPTIONLINE_EVENTS_IHOST_EVENT_BUS_H_

#include "captionline/timeline/TimelineTypes.h"

namespace captionline::events {

// Outcome of one subtitle fragment. Published at most once per fragment;
// parked fragments publish when they are replayed. Fragments discarded by
// OnMediaDetaching or OnManifestLoaded publish nothing: those still parked,
// those not yet reached by an interrupted replay, and those whose parse
// completes after the discard.
struct SubtitleFragmentProcessed {
  bool success = false;
  timeline::FragmentInfo fragment;
};

// IHostEventBus is implemented by the host player. Calls arrive on the
// host's event loop, from inside controller entry points or parser
// completions. A handler may call back into the controller, including
// OnMediaDetaching and OnManifestLoaded.
class IHostEventBus {
 public:
  virtual ~IHostEventBus() = default;

  virtual void PublishSubtitleFragmentProcessed(const SubtitleFragmentProcessed& event) = 0;
};

}  // namespace captionline::events

#endif  // CAPTIONLINE_EVENTS_IHOST_EVENT_BUS_H_
