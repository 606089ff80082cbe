// Repository: captionline
// Component: Caption Sample Reader
// Purpose: Pull A/53 cc_data user-data samples out of media files via FFmpeg.
// Copyright (c) 2025 captionline authors

#include "captionline/decode/CaptionSampleReader.h"

#include <sstream>

#include "captionline/captions/BytePairDemuxer.h"
#include "captionline/decode/PacketFeed.h"
#include "captionline/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
}

namespace captionline::decode {

using util::Logger;

namespace {

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

CaptionSampleReader::CaptionSampleReader(const CaptionReaderConfig& config)
    : config_(config) {}

CaptionSampleReader::~CaptionSampleReader() {
  Close();
}

bool CaptionSampleReader::Open() {
  {
    std::ostringstream oss;
    oss << "[CaptionSampleReader] Opening: " << config_.input_uri;
    Logger::Info(oss.str());
  }

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[CaptionSampleReader] open_input FAILED uri=" << config_.input_uri
        << " ret=" << ret << " err=" << AvErrorString(ret);
    Logger::Error(oss.str());
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    std::ostringstream oss;
    oss << "[CaptionSampleReader] find_stream_info FAILED uri=" << config_.input_uri
        << " ret=" << ret << " err=" << AvErrorString(ret);
    Logger::Error(oss.str());
    Close();
    return false;
  }

  if (!FindVideoStream()) {
    std::ostringstream oss;
    oss << "[CaptionSampleReader] find_video_stream FAILED uri=" << config_.input_uri
        << " (no video stream)";
    Logger::Error(oss.str());
    Close();
    return false;
  }

  if (!InitializeCodec()) {
    std::ostringstream oss;
    oss << "[CaptionSampleReader] initialize_codec FAILED uri=" << config_.input_uri;
    Logger::Error(oss.str());
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[CaptionSampleReader] packet_alloc FAILED");
    Close();
    return false;
  }

  std::ostringstream oss;
  oss << "[CaptionSampleReader] open OK uri=" << config_.input_uri
      << " video_stream=" << video_stream_index_;
  Logger::Info(oss.str());
  return true;
}

bool CaptionSampleReader::FindVideoStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; ++i) {
    AVStream* stream = format_ctx_->streams[i];
    if (stream->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      video_stream_index_ = static_cast<int>(i);
      time_base_ = av_q2d(stream->time_base);
      start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
      return true;
    }
  }
  return false;
}

bool CaptionSampleReader::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    std::ostringstream oss;
    oss << "[CaptionSampleReader] Codec not found: " << codecpar->codec_id;
    Logger::Error(oss.str());
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[CaptionSampleReader] Failed to allocate codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    Logger::Error("[CaptionSampleReader] Failed to copy codec parameters");
    return false;
  }

  if (config_.max_decode_threads > 0) {
    codec_ctx_->thread_count = config_.max_decode_threads;
  }

  if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
    Logger::Error("[CaptionSampleReader] Failed to open codec");
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    Logger::Error("[CaptionSampleReader] Failed to allocate frame");
    return false;
  }
  return true;
}

void CaptionSampleReader::Close() {
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  video_stream_index_ = -1;
  demux_eof_reached_ = false;
  eof_reached_ = false;
}

void CaptionSampleReader::CollectSideData(std::vector<timeline::UserdataSample>& out) {
  AVFrameSideData* side_data = av_frame_get_side_data(frame_, AV_FRAME_DATA_A53_CC);
  if (!side_data || side_data->size == 0) {
    return;
  }
  stats_.frames_with_captions++;

  int64_t pts = frame_->best_effort_timestamp;
  if (pts == AV_NOPTS_VALUE) {
    pts = frame_->pts;
  }
  const double pts_seconds =
      pts == AV_NOPTS_VALUE ? 0.0 : static_cast<double>(pts - start_time_) * time_base_;

  auto packed = captions::BytePairDemuxer::PackTriplets(side_data->data,
                                                        static_cast<size_t>(side_data->size));
  for (auto& bytes : packed) {
    timeline::UserdataSample sample;
    sample.pts = pts_seconds;
    sample.bytes = std::move(bytes);
    out.push_back(std::move(sample));
    stats_.samples_emitted++;
  }
}

int CaptionSampleReader::ReceiveFrames(std::vector<timeline::UserdataSample>& out) {
  int received = 0;
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN)) {
      break;
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      break;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      std::ostringstream oss;
      oss << "[CaptionSampleReader] receive_frame error ret=" << ret
          << " err=" << AvErrorString(ret);
      Logger::Warn(oss.str());
      break;
    }
    stats_.frames_decoded++;
    CollectSideData(out);
    av_frame_unref(frame_);
    received++;
  }
  return received;
}

bool CaptionSampleReader::ReadNextFrame(std::vector<timeline::UserdataSample>& out) {
  if (!IsOpen() || eof_reached_) {
    return false;
  }

  while (true) {
    if (demux_eof_reached_) {
      // Codec already flushed; drain what remains.
      return ReceiveFrames(out) > 0 || !eof_reached_;
    }

    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      demux_eof_reached_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);  // Enter draining mode
      continue;
    }
    if (ret < 0) {
      std::ostringstream oss;
      oss << "[CaptionSampleReader] read_frame FAILED ret=" << ret
          << " err=" << AvErrorString(ret);
      Logger::Error(oss.str());
      eof_reached_ = true;
      return false;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }
    stats_.packets_read++;

    // The packet stays referenced until the decoder has accepted it.
    const PacketFeedResult fed = FeedPacket(
        [this] { return avcodec_send_packet(codec_ctx_, packet_); },
        [this, &out] { return ReceiveFrames(out); }, AVERROR(EAGAIN));
    av_packet_unref(packet_);
    ret = fed.send_result;
    const int drained = fed.drained;
    if (ret < 0) {
      stats_.decode_errors++;
      std::ostringstream oss;
      oss << "[CaptionSampleReader] send_packet error ret=" << ret
          << " err=" << AvErrorString(ret);
      Logger::Warn(oss.str());
      if (drained > 0) {
        return true;
      }
      continue;
    }

    if (drained + ReceiveFrames(out) > 0) {
      return true;
    }
  }
}

}  // namespace captionline::decode
