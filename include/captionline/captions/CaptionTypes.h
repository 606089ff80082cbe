// Repository: captionline
// Component: Caption Types
// Purpose: Line-21 byte pairs and decoder screen snapshots.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_CAPTIONS_CAPTION_TYPES_H_
#define CAPTIONLINE_CAPTIONS_CAPTION_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>

namespace captionline::captions {

// One line-21 character/control code pair, parity bits already stripped.
struct BytePair {
  uint8_t first = 0;
  uint8_t second = 0;

  bool operator==(const BytePair& other) const {
    return first == other.first && second == other.second;
  }
  bool operator!=(const BytePair& other) const { return !(*this == other); }
};

// Caption data channel (CC1/CC2 on field 1).
enum class CaptionChannel : int32_t {
  kChannel1 = 1,
  kChannel2 = 2
};

constexpr int32_t kCaptionChannelCount = 2;

inline int32_t ChannelIndex(CaptionChannel channel) {
  return static_cast<int32_t>(channel) - 1;
}

// Displayable rows of a caption decoder screen at cue emission time.
// Styling and positioning stay inside the decoder.
struct CaptionScreen {
  std::vector<std::string> rows;

  // Non-empty rows joined by '\n'.
  std::string ToText() const;
};

}  // namespace captionline::captions

#endif  // CAPTIONLINE_CAPTIONS_CAPTION_TYPES_H_
