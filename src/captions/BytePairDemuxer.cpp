// Repository: captionline
// Component: Byte-Pair Demultiplexer
// Purpose: Extract line-21 (CEA-608 field 1) byte pairs from cc_data samples.
// Copyright (c) 2025 captionline authors

#include "captionline/captions/BytePairDemuxer.h"

#include <utility>

namespace captionline::captions {

const char* DemuxStatusName(DemuxStatus status) {
  switch (status) {
    case DemuxStatus::kOk:
      return "ok";
    case DemuxStatus::kEmpty:
      return "empty";
    case DemuxStatus::kTruncated:
      return "truncated";
  }
  return "unknown";
}

DemuxResult BytePairDemuxer::Extract(const uint8_t* data, size_t size) {
  DemuxResult result;
  if (data == nullptr || size == 0) {
    result.status = DemuxStatus::kEmpty;
    return result;
  }

  const size_t count = data[0] & kCountMask;
  result.triplets_declared = count;
  if (size < kHeaderSize + count * kTripletSize) {
    result.status = DemuxStatus::kTruncated;
    return result;
  }

  size_t position = kHeaderSize;
  for (size_t j = 0; j < count; ++j) {
    const uint8_t marker = data[position++];
    const uint8_t cc_byte1 = data[position++] & kParityMask;
    const uint8_t cc_byte2 = data[position++] & kParityMask;
    const bool cc_valid = (marker & kValidBit) != 0;
    const uint8_t cc_type = marker & kTypeMask;

    if (cc_byte1 == 0 && cc_byte2 == 0) {
      continue;
    }

    if (cc_valid && cc_type == 0) {
      result.pairs.push_back(BytePair{cc_byte1, cc_byte2});
    }
  }
  return result;
}

std::vector<std::vector<uint8_t>> BytePairDemuxer::PackTriplets(const uint8_t* triplets,
                                                                size_t size) {
  constexpr uint8_t kProcessCcDataFlag = 0x40;
  constexpr uint8_t kEmData = 0xFF;

  std::vector<std::vector<uint8_t>> samples;
  if (triplets == nullptr) {
    return samples;
  }

  size_t remaining = size / kTripletSize;
  const uint8_t* cursor = triplets;
  while (remaining > 0) {
    const size_t count = remaining > kCountMask ? kCountMask : remaining;
    std::vector<uint8_t> sample;
    sample.reserve(kHeaderSize + count * kTripletSize);
    sample.push_back(static_cast<uint8_t>(kProcessCcDataFlag | count));
    sample.push_back(kEmData);
    sample.insert(sample.end(), cursor, cursor + count * kTripletSize);
    samples.push_back(std::move(sample));

    cursor += count * kTripletSize;
    remaining -= count;
  }
  return samples;
}

}  // namespace captionline::captions
