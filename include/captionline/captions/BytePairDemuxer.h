// Repository: captionline
// Component: Byte-Pair Demultiplexer
// Purpose: Extract line-21 (CEA-608 field 1) byte pairs from cc_data samples.
// Copyright (c) 2025 captionline authors

#ifndef CAPTIONLINE_CAPTIONS_BYTE_PAIR_DEMUXER_H_
#define CAPTIONLINE_CAPTIONS_BYTE_PAIR_DEMUXER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "captionline/captions/CaptionTypes.h"

namespace captionline::captions {

enum class DemuxStatus {
  kOk,
  kEmpty,      // Zero-length sample
  kTruncated   // Header count needs more triplets than the sample holds
};

const char* DemuxStatusName(DemuxStatus status);

struct DemuxResult {
  DemuxStatus status = DemuxStatus::kOk;
  std::vector<BytePair> pairs;  // Empty unless status == kOk
  size_t triplets_declared = 0;

  bool ok() const { return status == DemuxStatus::kOk; }
};

// BytePairDemuxer reads one cc_data() user-data sample:
//
//   byte 0      : flags | cc_count (low 5 bits)
//   byte 1      : em_data (ignored)
//   byte 2..    : cc_count triplets {marker, cc_data_1, cc_data_2}
//
// marker bit 2 is cc_valid, bits 0-1 are cc_type. Data bytes are stripped of
// their parity bit. Padding triplets (both data bytes zero) are skipped.
// Only valid type-0 triplets (NTSC line 21 field 1) are emitted; field 2 and
// DTVCC packet data are dropped.
//
// A sample whose declared count does not fit the buffer is rejected whole.
class BytePairDemuxer {
 public:
  static constexpr size_t kHeaderSize = 2;
  static constexpr size_t kTripletSize = 3;
  static constexpr uint8_t kCountMask = 0x1F;
  static constexpr uint8_t kParityMask = 0x7F;
  static constexpr uint8_t kValidBit = 0x04;
  static constexpr uint8_t kTypeMask = 0x03;

  static DemuxResult Extract(const uint8_t* data, size_t size);
  static DemuxResult Extract(const std::vector<uint8_t>& sample) {
    return Extract(sample.data(), sample.size());
  }

  // Wraps bare cc_data triplets (e.g. AV_FRAME_DATA_A53_CC side data) in the
  // sample layout above: 0x40 | cc_count, 0xFF, triplets. Runs longer than
  // 31 triplets are split into several samples; a trailing partial triplet
  // is discarded.
  static std::vector<std::vector<uint8_t>> PackTriplets(const uint8_t* triplets, size_t size);
};

}  // namespace captionline::captions

#endif  // CAPTIONLINE_CAPTIONS_BYTE_PAIR_DEMUXER_H_
