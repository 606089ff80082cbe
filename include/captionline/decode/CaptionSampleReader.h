// Repository: captionline
// Component: Caption Sample Reader
// Purpose: Pull A/53 cc_data user-data samples out of media files via FFmpeg.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_DECODE_CAPTION_SAMPLE_READER_H_
#define CAPTIONLINE_DECODE_CAPTION_SAMPLE_READER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "captionline/timeline/TimelineTypes.h"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;

namespace captionline::decode {

struct CaptionReaderConfig {
  std::string input_uri;        // File path or URI to read
  int max_decode_threads = 0;   // Maximum decoder threads (0 = auto)
};

struct CaptionReaderStats {
  uint64_t packets_read = 0;
  uint64_t frames_decoded = 0;
  uint64_t frames_with_captions = 0;
  uint64_t samples_emitted = 0;
  uint64_t decode_errors = 0;
};

// CaptionSampleReader decodes the first video stream of a file and turns the
// AV_FRAME_DATA_A53_CC side data of every decoded frame into UserdataSample
// values in the cc_data() layout BytePairDemuxer expects.
//
// Pictures are decoded only for their side data; nothing is scaled or kept.
// Samples are produced in decode (presentation) order with PTS in seconds.
//
// Thread Safety:
// - Not thread-safe: use from one thread
//
// Error Handling:
// - Open() returns false and logs when the input cannot be opened
// - Transient decode errors are counted and skipped
class CaptionSampleReader {
 public:
  explicit CaptionSampleReader(const CaptionReaderConfig& config);
  ~CaptionSampleReader();

  // Disable copy and move
  CaptionSampleReader(const CaptionSampleReader&) = delete;
  CaptionSampleReader& operator=(const CaptionSampleReader&) = delete;

  bool Open();

  // Reads packets until at least one video frame is decoded, appending that
  // frame's caption samples (possibly none) to `out`.
  // Returns false at end of stream or on a hard error.
  bool ReadNextFrame(std::vector<timeline::UserdataSample>& out);

  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }
  bool IsEOF() const { return eof_reached_; }

  const CaptionReaderStats& GetStats() const { return stats_; }

 private:
  bool FindVideoStream();
  bool InitializeCodec();

  // Drains every frame the codec has ready. Returns the number drained.
  int ReceiveFrames(std::vector<timeline::UserdataSample>& out);
  void CollectSideData(std::vector<timeline::UserdataSample>& out);

  CaptionReaderConfig config_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;

  int video_stream_index_ = -1;
  double time_base_ = 0.0;
  int64_t start_time_ = 0;
  bool demux_eof_reached_ = false;
  bool eof_reached_ = false;

  CaptionReaderStats stats_;
};

}  // namespace captionline::decode

#endif  // CAPTIONLINE_DECODE_CAPTION_SAMPLE_READER_H_
