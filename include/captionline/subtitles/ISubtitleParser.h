// Repository: captionline
// Component: ISubtitleParser
// Purpose: Narrow surface of the segmented subtitle (WebVTT) parser.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_SUBTITLES_ISUBTITLE_PARSER_H_
#define CAPTIONLINE_SUBTITLES_ISUBTITLE_PARSER_H_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "captionline/timeline/ContinuityMap.h"
#include "captionline/timeline/TimelineTypes.h"

namespace captionline::subtitles {

using ParseSuccessCallback = std::function<void(std::vector<timeline::Cue> cues)>;
using ParseErrorCallback = std::function<void(const std::string& reason)>;

// ISubtitleParser converts one subtitle fragment into absolute-time cues.
//
// reference_pts  : stream time zero, 90 kHz ticks
// continuity_map : per-discontinuity rebasing entries; the parser may update
//                  the map's offsets and read/clear entry flags
// cc             : discontinuity id of this fragment
//
// Exactly one of the callbacks is invoked, either before Parse() returns or
// later from the host event loop. Completions of different fragments may be
// reordered. The map reference stays valid until the next manifest load.
class ISubtitleParser {
 public:
  virtual ~ISubtitleParser() = default;

  virtual void Parse(const timeline::Payload& payload,
                     int64_t reference_pts,
                     timeline::ContinuityMap& continuity_map,
                     int32_t cc,
                     ParseSuccessCallback on_success,
                     ParseErrorCallback on_error) = 0;
};

}  // namespace captionline::subtitles

#endif  // CAPTIONLINE_SUBTITLES_ISUBTITLE_PARSER_H_
