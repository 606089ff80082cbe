// Repository: captionline
// Component: Byte-Pair Demuxer Contract Tests
// Purpose: Line-21 byte pair extraction from cc_data samples.
// Copyright (c) 2025 captionline authors

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "captionline/captions/BytePairDemuxer.h"

namespace captionline::tests {
namespace {

using captions::BytePair;
using captions::BytePairDemuxer;
using captions::DemuxStatus;

// Markers: 0xFC valid field 1, 0xFD valid field 2, 0xFE/0xFF DTVCC,
// 0xF8 invalid field 1.
constexpr uint8_t kField1 = 0xFC;
constexpr uint8_t kField2 = 0xFD;
constexpr uint8_t kDtvccStart = 0xFF;
constexpr uint8_t kInvalidField1 = 0xF8;

std::vector<uint8_t> MakeSample(const std::vector<std::vector<uint8_t>>& triplets) {
  std::vector<uint8_t> sample;
  sample.push_back(static_cast<uint8_t>(0xC0 | triplets.size()));
  sample.push_back(0xFF);
  for (const auto& triplet : triplets) {
    sample.insert(sample.end(), triplet.begin(), triplet.end());
  }
  return sample;
}

// ============================================================================
// Extraction
// ============================================================================

TEST(BytePairDemuxerTest, ExtractsField1PairsInOrder) {
  auto result = BytePairDemuxer::Extract(MakeSample({
      {kField1, 0x14, 0x2C},
      {kField1, 0x48, 0x49},
  }));

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.triplets_declared, 2u);
  ASSERT_EQ(result.pairs.size(), 2u);
  EXPECT_EQ(result.pairs[0], (BytePair{0x14, 0x2C}));
  EXPECT_EQ(result.pairs[1], (BytePair{0x48, 0x49}));
}

TEST(BytePairDemuxerTest, StripsParityBit) {
  // 0xC8 0xE9 carry odd parity for 'H' 'i'.
  auto result = BytePairDemuxer::Extract(MakeSample({{kField1, 0xC8, 0xE9}}));

  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.pairs.size(), 1u);
  EXPECT_EQ(result.pairs[0], (BytePair{0x48, 0x69}));
}

TEST(BytePairDemuxerTest, PaddingTripletProducesNoOutput) {
  // 0x80 0x80 is all-zero once parity is stripped.
  auto result = BytePairDemuxer::Extract(MakeSample({
      {kField1, 0x80, 0x80},
      {kField1, 0x00, 0x00},
      {kField1, 0x41, 0x42},
  }));

  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.pairs.size(), 1u);
  EXPECT_EQ(result.pairs[0], (BytePair{0x41, 0x42}));
}

TEST(BytePairDemuxerTest, NonZeroTypeIsValidButDropped) {
  auto result = BytePairDemuxer::Extract(MakeSample({
      {kField2, 0x41, 0x42},
      {0xFE, 0x41, 0x42},
      {kDtvccStart, 0x41, 0x42},
  }));

  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.pairs.empty());
}

TEST(BytePairDemuxerTest, InvalidTripletProducesNoOutputRegardlessOfType) {
  auto result = BytePairDemuxer::Extract(MakeSample({
      {kInvalidField1, 0x41, 0x42},
      {0xF9, 0x41, 0x42},
      {0xFB, 0x41, 0x42},
  }));

  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.pairs.empty());
}

TEST(BytePairDemuxerTest, ReservedHeaderBitsAreIgnored) {
  std::vector<uint8_t> sample = {0xE1, 0x00, kField1, 0x20, 0x21};
  auto result = BytePairDemuxer::Extract(sample);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.triplets_declared, 1u);
  ASSERT_EQ(result.pairs.size(), 1u);
}

TEST(BytePairDemuxerTest, TrailingBytesBeyondCountAreIgnored) {
  std::vector<uint8_t> sample = {0x41, 0xFF, kField1, 0x20, 0x21, kField1, 0x30, 0x31};
  auto result = BytePairDemuxer::Extract(sample);

  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.pairs.size(), 1u);
  EXPECT_EQ(result.pairs[0], (BytePair{0x20, 0x21}));
}

TEST(BytePairDemuxerTest, ZeroCountYieldsNoPairs) {
  std::vector<uint8_t> sample = {0x40, 0xFF};
  auto result = BytePairDemuxer::Extract(sample);

  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result.pairs.empty());
}

// ============================================================================
// Malformed samples
// ============================================================================

TEST(BytePairDemuxerTest, EmptySampleIsRejected) {
  auto result = BytePairDemuxer::Extract(std::vector<uint8_t>{});
  EXPECT_EQ(result.status, DemuxStatus::kEmpty);
  EXPECT_FALSE(result.ok());

  EXPECT_EQ(BytePairDemuxer::Extract(nullptr, 4).status, DemuxStatus::kEmpty);
}

TEST(BytePairDemuxerTest, CountBeyondBufferRejectsWholeSample) {
  // Declares 3 triplets, carries 1.
  std::vector<uint8_t> sample = {0x43, 0xFF, kField1, 0x41, 0x42};
  auto result = BytePairDemuxer::Extract(sample);

  EXPECT_EQ(result.status, DemuxStatus::kTruncated);
  EXPECT_EQ(result.triplets_declared, 3u);
  EXPECT_TRUE(result.pairs.empty());
}

TEST(BytePairDemuxerTest, HeaderOnlyFragmentWithCountIsTruncated) {
  std::vector<uint8_t> sample = {0x41};
  EXPECT_EQ(BytePairDemuxer::Extract(sample).status, DemuxStatus::kTruncated);
}

TEST(BytePairDemuxerTest, StatusNamesAreStable) {
  EXPECT_STREQ(captions::DemuxStatusName(DemuxStatus::kOk), "ok");
  EXPECT_STREQ(captions::DemuxStatusName(DemuxStatus::kEmpty), "empty");
  EXPECT_STREQ(captions::DemuxStatusName(DemuxStatus::kTruncated), "truncated");
}

// ============================================================================
// Packing bare triplets (frame side data)
// ============================================================================

TEST(BytePairDemuxerTest, PackTripletsBuildsExtractableSample) {
  const std::vector<uint8_t> triplets = {kField1, 0x94, 0x2C, kField2, 0x80, 0x80};
  auto samples = BytePairDemuxer::PackTriplets(triplets.data(), triplets.size());

  ASSERT_EQ(samples.size(), 1u);
  ASSERT_EQ(samples[0].size(), 8u);
  EXPECT_EQ(samples[0][0], 0x42);
  EXPECT_EQ(samples[0][1], 0xFF);

  auto result = BytePairDemuxer::Extract(samples[0]);
  ASSERT_TRUE(result.ok());
  ASSERT_EQ(result.pairs.size(), 1u);
  EXPECT_EQ(result.pairs[0], (BytePair{0x14, 0x2C}));
}

TEST(BytePairDemuxerTest, PackTripletsSplitsLongRuns) {
  std::vector<uint8_t> triplets;
  for (int i = 0; i < 40; ++i) {
    triplets.push_back(kField1);
    triplets.push_back(0x41);
    triplets.push_back(0x42);
  }
  triplets.push_back(kField1);  // Partial trailing triplet

  auto samples = BytePairDemuxer::PackTriplets(triplets.data(), triplets.size());

  ASSERT_EQ(samples.size(), 2u);
  EXPECT_EQ(samples[0][0] & BytePairDemuxer::kCountMask, 31);
  EXPECT_EQ(samples[1][0] & BytePairDemuxer::kCountMask, 9);

  size_t pairs = 0;
  for (const auto& sample : samples) {
    auto result = BytePairDemuxer::Extract(sample);
    ASSERT_TRUE(result.ok());
    pairs += result.pairs.size();
  }
  EXPECT_EQ(pairs, 40u);
}

TEST(BytePairDemuxerTest, PackTripletsOfNothingIsEmpty) {
  EXPECT_TRUE(BytePairDemuxer::PackTriplets(nullptr, 0).empty());
  const uint8_t partial[] = {kField1, 0x41};
  EXPECT_TRUE(BytePairDemuxer::PackTriplets(partial, sizeof(partial)).empty());
}

}  // namespace
}  // namespace captionline::tests
