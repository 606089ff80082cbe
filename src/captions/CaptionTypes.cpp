// Repository: captionline
// Component: Caption Types
// Purpose: Line-21 byte pairs and decoder screen snapshots.
// Copyright (c) 2025 captionline authors

#include "captionline/captions/CaptionTypes.h"

namespace captionline::captions {

std::string CaptionScreen::ToText() const {
  std::string text;
  for (const auto& row : rows) {
    if (row.empty()) continue;
    if (!text.empty()) text += '\n';
    text += row;
  }
  return text;
}

}  // namespace captionline::captions
