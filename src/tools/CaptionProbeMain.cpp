// Repository: captionline
// Component: Caption Probe
// Purpose: Diagnostic tool that drives the timeline controller from a media file
// Copyright (c) 2025 captionline authors
//
// Reads A/53 closed-caption user data from the first video stream of a file
// and feeds it through TimelineController::OnFragParsingUserdata. The bundled
// decoder does not interpret CEA-608 control codes; it traces the line-21
// byte pairs the controller hands it.
//
// Usage: captionline_probe --input movie.ts [--config captions.json] [--max-frames N]

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "captionline/captions/ICaptionDecoder.h"
#include "captionline/config/CaptionConfig.h"
#include "captionline/decode/CaptionSampleReader.h"
#include "captionline/events/IHostEventBus.h"
#include "captionline/output/InMemoryTrackSink.h"
#include "captionline/timeline/TimelineController.h"
#include "captionline/util/Logger.hpp"

namespace {

using captionline::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    std::cerr << "\n[PROBE] Received signal " << signal << ", stopping...\n";
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// Trace collaborators
// =============================================================================

class TraceCaptionDecoder : public captionline::captions::ICaptionDecoder {
 public:
  explicit TraceCaptionDecoder(bool verbose) : verbose_(verbose) {}

  void Reset() override { Logger::Info("[PROBE] decoder reset"); }

  void AddData(double pts, const std::vector<captionline::captions::BytePair>& pairs) override {
    pairs_seen_ += pairs.size();
    if (!verbose_ || pairs.empty()) {
      return;
    }
    std::ostringstream oss;
    oss << "[PROBE] pts=" << std::fixed << std::setprecision(3) << pts << " pairs=";
    oss << std::hex << std::setfill('0');
    for (const auto& pair : pairs) {
      oss << std::setw(2) << static_cast<int>(pair.first) << std::setw(2)
          << static_cast<int>(pair.second) << ' ';
    }
    Logger::Info(oss.str());
  }

  void SetCueListener(captionline::captions::ICaptionCueListener* listener) override {
    listener_ = listener;
  }

  uint64_t PairsSeen() const { return pairs_seen_; }

 private:
  bool verbose_;
  uint64_t pairs_seen_ = 0;
  captionline::captions::ICaptionCueListener* listener_ = nullptr;
};

class LoggingEventBus : public captionline::events::IHostEventBus {
 public:
  void PublishSubtitleFragmentProcessed(
      const captionline::events::SubtitleFragmentProcessed& event) override {
    std::ostringstream oss;
    oss << "[PROBE] SUBTITLE_FRAGMENT_PROCESSED success=" << (event.success ? 1 : 0)
        << " sn=" << event.fragment.sn;
    Logger::Info(oss.str());
  }
};

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string input_path;
  std::string config_path;
  uint64_t max_frames = 0;  // 0 = unlimited
  int decode_threads = 0;
  bool verbose = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Reads closed-caption user data from a media file and routes it\n"
            << "through the caption timeline.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --input PATH         Media file to probe (required)\n"
            << "  --config PATH        Caption configuration JSON\n"
            << "  --max-frames N       Stop after N decoded video frames (default: unlimited)\n"
            << "  --threads N          Decoder thread count (default: auto)\n"
            << "  --verbose            Print every line-21 byte pair\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "    " << program_name << " --input capture.ts --verbose\n"
            << "    " << program_name << " --input capture.ts --config captions.json --max-frames 600\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      return args;
    } else if (arg == "--input") {
      if (i + 1 >= argc) {
        args.error = "--input requires a path argument";
        return args;
      }
      args.input_path = argv[++i];
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "--config requires a path argument";
        return args;
      }
      args.config_path = argv[++i];
    } else if (arg == "--max-frames") {
      if (i + 1 >= argc) {
        args.error = "--max-frames requires a numeric argument";
        return args;
      }
      char* end = nullptr;
      args.max_frames = std::strtoull(argv[++i], &end, 10);
      if (end == nullptr || *end != '\0') {
        args.error = "--max-frames requires a numeric argument";
        return args;
      }
    } else if (arg == "--threads") {
      if (i + 1 >= argc) {
        args.error = "--threads requires a numeric argument";
        return args;
      }
      args.decode_threads = std::atoi(argv[++i]);
    } else if (arg == "--verbose") {
      args.verbose = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.input_path.empty()) {
    args.error = "--input is required";
    return args;
  }

  args.valid = true;
  return args;
}

bool LoadConfig(const std::string& path, captionline::config::CaptionConfig& out) {
  std::ifstream file(path);
  if (!file) {
    std::cerr << "Error: Cannot open config file: " << path << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = captionline::config::CaptionConfig::FromJson(buffer.str());
  if (!parsed) {
    std::cerr << "Error: Invalid caption configuration: " << path << "\n";
    return false;
  }
  out = *parsed;
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  captionline::config::CaptionConfig config;
  if (!args.config_path.empty() && !LoadConfig(args.config_path, config)) {
    return 1;
  }
  // Nothing in this tool parses subtitle fragments.
  config.enable_webvtt = false;
  config.enable_cea708_captions = true;

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  auto decoder = std::make_shared<TraceCaptionDecoder>(args.verbose);
  auto event_bus = std::make_shared<LoggingEventBus>();
  captionline::output::InMemoryTrackSink sink;

  captionline::timeline::TimelineController controller(config, decoder, nullptr, event_bus);
  controller.OnMediaAttaching(&sink);
  controller.OnManifestLoaded({});

  captionline::decode::CaptionReaderConfig reader_config;
  reader_config.input_uri = args.input_path;
  reader_config.max_decode_threads = args.decode_threads;
  captionline::decode::CaptionSampleReader reader(reader_config);
  if (!reader.Open()) {
    std::cerr << "Error: Cannot open input: " << args.input_path << "\n";
    return 1;
  }

  std::vector<captionline::timeline::UserdataSample> samples;
  uint64_t frames = 0;
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    samples.clear();
    if (!reader.ReadNextFrame(samples)) {
      break;
    }
    ++frames;
    if (!samples.empty()) {
      controller.OnFragParsingUserdata(samples);
    }
    if (args.max_frames > 0 && frames >= args.max_frames) {
      break;
    }
  }

  for (const auto& track : sink.ListTracks()) {
    std::cout << "[PROBE] TRACK handle=" << track.handle
              << " kind=" << captionline::output::TrackKindName(track.kind)
              << " label=" << track.label << " lang=" << track.language
              << " mode=" << captionline::output::TrackModeName(track.mode)
              << " cues=" << sink.CueCount(track.handle) << "\n";
  }

  const bool reached_eof = reader.IsEOF();
  controller.OnMediaDetaching();
  reader.Close();

  const auto& reader_stats = reader.GetStats();
  const auto stats = controller.GetStats();
  std::cout << "[PROBE] SUMMARY"
            << " frames_decoded=" << reader_stats.frames_decoded
            << " frames_with_captions=" << reader_stats.frames_with_captions
            << " samples=" << reader_stats.samples_emitted
            << " samples_rejected=" << stats.samples_rejected
            << " line21_pairs=" << decoder->PairsSeen()
            << " decode_errors=" << reader_stats.decode_errors
            << " eof=" << (reached_eof ? 1 : 0) << "\n";
  return 0;
}
