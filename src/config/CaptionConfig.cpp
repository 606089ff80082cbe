// Repository: captionline
// Component: CaptionConfig
// Purpose: Parse and validate CaptionConfig from JSON.
// Copyright (c) 2025 captionline authors

#include "captionline/config/CaptionConfig.h"

#include <regex>
#include <sstream>
#include <utility>

namespace captionline::config {

namespace {
  // The schema is flat and fixed, so fields are pulled out with regexes.

  enum class FieldState { kAbsent, kFound, kMalformed };

  // Any occurrence of the key, regardless of value type.
  bool HasKey(const std::string& json, const std::string& field_name) {
    std::regex pattern("\"" + field_name + "\"\\s*:");
    return std::regex_search(json, pattern);
  }

  FieldState ExtractBool(const std::string& json, const std::string& field_name, bool& out_value) {
    if (!HasKey(json, field_name)) {
      return FieldState::kAbsent;
    }
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*(true|false)\\b");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return FieldState::kMalformed;
    }
    out_value = (match[1].str() == "true");
    return FieldState::kFound;
  }

  // Accepts the escapes EscapeJson() writes (\" and \\) and nothing else.
  bool UnescapeJson(const std::string& raw, std::string& out_value) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
      char c = raw[i];
      if (c == '\\') {
        if (i + 1 >= raw.size()) return false;
        c = raw[++i];
        if (c != '"' && c != '\\') return false;
      }
      out += c;
    }
    out_value = std::move(out);
    return true;
  }

  FieldState ExtractString(const std::string& json, const std::string& field_name, std::string& out_value) {
    if (!HasKey(json, field_name)) {
      return FieldState::kAbsent;
    }
    std::regex pattern("\"" + field_name + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    std::smatch match;
    if (!std::regex_search(json, match, pattern)) {
      return FieldState::kMalformed;
    }
    return UnescapeJson(match[1].str(), out_value) ? FieldState::kFound : FieldState::kMalformed;
  }

  std::string EscapeJson(const std::string& value) {
    std::string out;
    for (char c : value) {
      if (c == '"' || c == '\\') out += '\\';
      out += c;
    }
    return out;
  }
}

std::optional<CaptionConfig> CaptionConfig::FromJson(const std::string& json_str) {
  if (json_str.empty()) {
    return std::nullopt;
  }

  // Must look like an object.
  std::regex object_pattern(R"(^\s*\{[\s\S]*\}\s*$)");
  if (!std::regex_match(json_str, object_pattern)) {
    return std::nullopt;
  }

  CaptionConfig config;

  if (ExtractBool(json_str, "enable_cea708_captions", config.enable_cea708_captions) ==
      FieldState::kMalformed) {
    return std::nullopt;
  }
  if (ExtractBool(json_str, "enable_webvtt", config.enable_webvtt) == FieldState::kMalformed) {
    return std::nullopt;
  }

  const std::pair<const char*, std::string*> string_fields[] = {
      {"captions_text_track1_label", &config.captions_text_track1_label},
      {"captions_text_track1_language_code", &config.captions_text_track1_language_code},
      {"captions_text_track2_label", &config.captions_text_track2_label},
      {"captions_text_track2_language_code", &config.captions_text_track2_language_code},
  };
  for (const auto& field : string_fields) {
    if (ExtractString(json_str, field.first, *field.second) == FieldState::kMalformed) {
      return std::nullopt;
    }
  }

  if (!config.IsValid()) {
    return std::nullopt;
  }

  return config;
}

std::string CaptionConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"enable_cea708_captions\": " << (enable_cea708_captions ? "true" : "false") << ", "
      << "\"enable_webvtt\": " << (enable_webvtt ? "true" : "false") << ", "
      << "\"captions_text_track1_label\": \"" << EscapeJson(captions_text_track1_label) << "\", "
      << "\"captions_text_track1_language_code\": \""
      << EscapeJson(captions_text_track1_language_code) << "\", "
      << "\"captions_text_track2_label\": \"" << EscapeJson(captions_text_track2_label) << "\", "
      << "\"captions_text_track2_language_code\": \""
      << EscapeJson(captions_text_track2_language_code) << "\""
      << "}";
  return oss.str();
}

bool CaptionConfig::IsValid() const {
  return !captions_text_track1_label.empty() &&
         !captions_text_track1_language_code.empty() &&
         !captions_text_track2_label.empty() &&
         !captions_text_track2_language_code.empty();
}

}  // namespace captionline::config
