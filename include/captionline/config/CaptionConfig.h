// Repository: captionline
// Component: CaptionConfig
// Purpose: Read-only caption/subtitle settings supplied by the host.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_CONFIG_CAPTION_CONFIG_H_
#define CAPTIONLINE_CONFIG_CAPTION_CONFIG_H_

#include <optional>
#include <string>

namespace captionline::config {

// CaptionConfig is fixed for the lifetime of a TimelineController.
struct CaptionConfig {
  bool enable_cea708_captions = true;  // Process embedded line-21 captions
  bool enable_webvtt = true;           // Create subtitle tracks and parse fragments

  std::string captions_text_track1_label = "English";
  std::string captions_text_track1_language_code = "en";
  std::string captions_text_track2_label = "Spanish";
  std::string captions_text_track2_language_code = "es";

  // Parse from a flat JSON object, e.g.
  //   {"enable_webvtt": false, "captions_text_track1_label": "English CC"}
  // Keys that are absent keep their defaults. Returns empty optional when a
  // present key has a value of the wrong type or validation fails.
  static std::optional<CaptionConfig> FromJson(const std::string& json_str);

  // Convert to JSON string (for debugging/logging).
  std::string ToJson() const;

  // Labels and language codes must be non-empty.
  bool IsValid() const;
};

}  // namespace captionline::config

#endif  // CAPTIONLINE_CONFIG_CAPTION_CONFIG_H_
