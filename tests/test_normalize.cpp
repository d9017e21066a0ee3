#include <gtest/gtest.h>
#include <array>
#include <vector>
#include "iqdec/utils/byte_order.hpp"
#include "iqdec/utils/normalize.hpp"

using namespace iqdec;
using namespace iqdec::utils;

TEST(Normalize, InterleavedPairsBecomeComplex) {
  const std::array<int16_t, 4> raw{3, -4, 5, 6};
  auto out = interleaved_to_complex<int16_t>(raw, 1.0);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], Sample(3.0, -4.0));
  EXPECT_EQ(out[1], Sample(5.0, 6.0));
}

TEST(Normalize, QFirstOrderAndScale) {
  const std::array<int32_t, 4> raw{10, 20, 30, 40};
  auto out = interleaved_to_complex<int32_t>(raw, 0.5, IqOrder::QI);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], Sample(10.0, 5.0));
  EXPECT_EQ(out[1], Sample(20.0, 15.0));
}

TEST(Normalize, BigEndianBytes) {
  const std::vector<uint8_t> bytes{0x00, 0x01, 0xFF, 0xFE, 0x01, 0x00, 0x80, 0x00};
  SampleBuffer out;
  append_interleaved_bytes<int16_t>(bytes, ByteOrder::Big, IqOrder::IQ, 1.0, out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0], Sample(1.0, -2.0));
  EXPECT_EQ(out[1], Sample(256.0, -32768.0));
}

TEST(Normalize, AppendKeepsExistingSamples) {
  const std::vector<uint8_t> bytes{0x02, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00};
  SampleBuffer out{Sample(9.0, 9.0)};
  append_interleaved_bytes<int32_t>(bytes, ByteOrder::Little, IqOrder::IQ, 2.0, out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1], Sample(4.0, 6.0));
}

TEST(Normalize, PlanarChannels) {
  const std::array<int16_t, 3> i{1, 2, 3};
  const std::array<int16_t, 3> q{-1, -2, -3};
  auto out = planar_to_complex<int16_t>(i, q, 0.25);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[2], Sample(0.75, -0.75));

  const std::array<int16_t, 2> short_q{0, 0};
  EXPECT_THROW(planar_to_complex<int16_t>(i, short_q, 1.0), std::invalid_argument);
}

TEST(ByteOrder, LoadsIndependentOfHost) {
  const uint8_t p[8] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
  EXPECT_EQ(load_le<uint32_t>(p), 0x04030201u);
  EXPECT_EQ(load_be<uint32_t>(p), 0x01020304u);
  EXPECT_EQ(load_be<uint64_t>(p), 0x0102030405060708ull);
  const uint8_t one[4] = {0x00, 0x00, 0x80, 0x3F};
  EXPECT_EQ(load_le<float>(one), 1.0f);
}
