#include <gtest/gtest.h>
#include <cmath>
#include "capture_fixtures.hpp"
#include "iqdec/error.hpp"
#include "iqdec/formats/iqt.hpp"

using namespace iqdec;
using namespace iqdec::formats;
using iqdec::test::IqtCapture;
using iqdec::test::ScratchDir;

TEST(IqtHeader, ParsesUnitsAndKeepsDateText) {
  auto h = parse_iqt_header(iqdec::test::iqt_header_text(IqtCapture{}));
  EXPECT_EQ(h.fft_points, 4u);
  EXPECT_EQ(h.valid_frames, 3u);
  EXPECT_DOUBLE_EQ(h.center_frequency, 245e6);
  EXPECT_DOUBLE_EQ(h.span, 500e3);
  EXPECT_DOUBLE_EQ(h.frame_length, 4e-6);
  EXPECT_DOUBLE_EQ(h.sample_rate(), 1e6);
  EXPECT_EQ(h.date_time, "2019/04/23 10:15:00 AM");
}

TEST(IqtHeader, MissingKeyIsNamed) {
  try {
    parse_iqt_header("FFTPoints=1024\nMaxInputLevel=0\n");
    FAIL() << "expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedMetadata);
    EXPECT_EQ(e.field(), "LevelOffset");
  }
}

TEST(IqtHeader, FrameCountBeyond64BitsIsMalformed) {
  std::string text = iqdec::test::iqt_header_text(IqtCapture{});
  text.replace(text.find("ValidFrames=3"), 13, "ValidFrames=1e30");
  try {
    parse_iqt_header(text);
    FAIL() << "expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedMetadata);
    EXPECT_EQ(e.field(), "ValidFrames");
  }
  text.replace(text.find("1e30"), 4, "1e18");
  EXPECT_THROW(parse_iqt_header(text), DecodeError);
}

TEST(IqtHeader, ScaleFormula) {
  EXPECT_DOUBLE_EQ(iqt_scale(0, 0, 0), std::sqrt(0.1));
  EXPECT_DOUBLE_EQ(iqt_scale(10, -5, 5), std::sqrt(10.0 / 20.0 * 2.0));
}

TEST(IqtReader, ProbeFillsMetadata) {
  ScratchDir dir;
  IqtReader reader(dir.write("cap.iqt", iqdec::test::make_iqt(IqtCapture{})));
  const auto& meta = reader.probe();
  EXPECT_EQ(meta.total_samples, 12u);
  EXPECT_DOUBLE_EQ(meta.sample_rate_hz, 1e6);
  EXPECT_DOUBLE_EQ(meta.center_hz, 245e6);
  EXPECT_DOUBLE_EQ(meta.scale, std::sqrt(0.1));
  const auto& geom = std::get<FrameGeometry>(reader.geometry());
  EXPECT_EQ(geom.frame_size, 24u + 16u);
  EXPECT_EQ(geom.frame_count, 3u);
}

TEST(IqtReader, WindowAcrossFramesReordersQI) {
  ScratchDir dir;
  IqtReader reader(dir.write("cap.iqt", iqdec::test::make_iqt(IqtCapture{})));
  auto res = reader.read({.frame_length = 2, .frame_count = 3, .start_frame = 2});
  ASSERT_EQ(res.samples.size(), 6u);
  const double scale = std::sqrt(0.1);
  for (std::size_t j = 0; j < res.samples.size(); ++j) {
    const double v = static_cast<double>(j + 3);
    EXPECT_DOUBLE_EQ(res.samples[j].real(), v * scale) << j;
    EXPECT_DOUBLE_EQ(res.samples[j].imag(), -v * scale) << j;
  }
  ASSERT_EQ(reader.last_frame_headers().size(), 2u);
  EXPECT_EQ(reader.last_frame_headers()[1].overload, 1);
  EXPECT_EQ(reader.last_frame_headers()[1].ticks, 100);
}

TEST(IqtReader, WholeFileThenPastEnd) {
  ScratchDir dir;
  IqtReader reader(dir.write("cap.iqt", iqdec::test::make_iqt(IqtCapture{})));
  EXPECT_EQ(reader.read({.frame_length = 4, .frame_count = 3, .start_frame = 1}).samples.size(), 12u);
  try {
    reader.read({.frame_length = 4, .frame_count = 2, .start_frame = 3});
    FAIL() << "expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::OutOfRange);
  }
}

TEST(IqtReader, TruncatedFrameIsStructural) {
  ScratchDir dir;
  auto bytes = iqdec::test::make_iqt(IqtCapture{});
  bytes.pop_back();
  IqtReader reader(dir.write("cap.iqt", bytes));
  try {
    reader.probe();
    FAIL() << "expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::StructuralMismatch);
    EXPECT_EQ(e.field(), "ValidFrames");
  }
}

TEST(IqHeaderReader, HeaderOnlyMetadata) {
  ScratchDir dir;
  IqtCapture capture;
  capture.fft_points = 1024;
  capture.frames = 7;
  capture.frame_length = "2.048m";
  IqHeaderReader reader(dir.write("cap.iq", iqdec::test::length_prefixed(iqdec::test::iqt_header_text(capture)).b));
  const auto& meta = reader.probe();
  EXPECT_DOUBLE_EQ(meta.center_hz, 245e6);
  EXPECT_DOUBLE_EQ(meta.span_hz, 500e3);
  EXPECT_DOUBLE_EQ(meta.sample_rate_hz, 500e3);
  EXPECT_EQ(meta.total_samples, 7u * 1024u);
  EXPECT_EQ(meta.date_time, "2019/04/23 10:15:00 AM");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(reader.geometry()));

  try {
    reader.read({.frame_length = 16, .frame_count = 1, .start_frame = 1});
    FAIL() << "expected DecodeError";
  } catch (const DecodeError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::StructuralMismatch);
    EXPECT_EQ(e.field(), "payload");
  }
}
