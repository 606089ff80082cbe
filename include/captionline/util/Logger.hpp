// Repository: captionline
// Component: Logger
// Purpose: Mutex-protected log emission with test capture hooks.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_UTIL_LOGGER_HPP_
#define CAPTIONLINE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace captionline::util {

// Logger provides serialized log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when CAPTIONLINE_DEBUG env is set
// Warn  → stderr (per-fragment failures, rejected samples)
// Error → stderr (broken collaborator contracts)
//
// Test-only: the sink setters install a callback invoked for every line of
// that severity (in addition to the console). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace captionline::util

#endif  // CAPTIONLINE_UTIL_LOGGER_HPP_
