// Repository: captionline
// Component: ICaptionDecoder
// Purpose: Narrow surface of the line-21 control-code decoder.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_CAPTIONS_ICAPTION_DECODER_H_
#define CAPTIONLINE_CAPTIONS_ICAPTION_DECODER_H_

#include <vector>

#include "captionline/captions/CaptionTypes.h"

namespace captionline::captions {

// Receives one cue per channel whenever the decoder commits a screen.
class ICaptionCueListener {
 public:
  virtual ~ICaptionCueListener() = default;

  virtual void OnNewCue(CaptionChannel channel,
                        double start_time,
                        double end_time,
                        const CaptionScreen& screen) = 0;
};

// ICaptionDecoder owns the CEA-608 control-code state machine. The timeline
// controller only feeds it byte pairs and resets it on sequence gaps.
//
// Cues are delivered synchronously from AddData() to the registered listener.
class ICaptionDecoder {
 public:
  virtual ~ICaptionDecoder() = default;

  // Drops partially accumulated control codes and pending screens.
  virtual void Reset() = 0;

  // `pts` is the sample's presentation time in seconds.
  virtual void AddData(double pts, const std::vector<BytePair>& pairs) = 0;

  // Non-owning. Pass nullptr to detach.
  virtual void SetCueListener(ICaptionCueListener* listener) = 0;
};

}  // namespace captionline::captions

#endif  // CAPTIONLINE_CAPTIONS_ICAPTION_DECODER_H_
