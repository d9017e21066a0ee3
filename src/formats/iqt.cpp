#include "iqdec/formats/iqt.hpp"
#include "iqdec/constants.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"
#include "iqdec/utils/byte_order.hpp"
#include "iqdec/utils/normalize.hpp"
#include "iqdec/utils/text_header.hpp"
#include "iqdec/window.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <span>

namespace iqdec::formats {

namespace {

constexpr const char* kFormat = "iqt";

using HeaderMap = std::map<std::string, std::string>;

double require_number(const HeaderMap& kv, const char* key) {
    auto it = kv.find(key);
    if (it == kv.end()) throw_malformed(kFormat, "header key missing", key);
    auto v = utils::parse_scaled_number(it->second);
    if (!v) throw_malformed(kFormat, "value '" + it->second + "' is not numeric", key);
    return *v;
}

uint64_t require_count(const HeaderMap& kv, const char* key) {
    const double v = require_number(kv, key);
    const auto count = utils::to_count(v);
    if (!count) throw_malformed(kFormat, "value is not a non-negative integer below 2^64", key);
    return *count;
}

} // namespace

IqtHeader parse_iqt_header(std::string_view text) {
    const HeaderMap kv = utils::parse_key_value_lines(text);
    IqtHeader h;
    const uint64_t fft_points = require_count(kv, "FFTPoints");
    if (fft_points == 0 || fft_points > UINT32_MAX) throw_malformed(kFormat, "FFT points out of range", "FFTPoints");
    h.fft_points = static_cast<uint32_t>(fft_points);
    h.max_input_level = require_number(kv, "MaxInputLevel");
    h.level_offset = require_number(kv, "LevelOffset");
    h.frame_length = require_number(kv, "FrameLength");
    if (h.frame_length <= 0.0) throw_malformed(kFormat, "frame length must be positive", "FrameLength");
    h.gain_offset = require_number(kv, "GainOffset");
    h.center_frequency = require_number(kv, "CenterFrequency");
    h.span = require_number(kv, "Span");
    h.valid_frames = require_count(kv, "ValidFrames");
    if (h.valid_frames > UINT64_MAX / (IQT_FRAME_HEADER_SIZE + 4ull * h.fft_points))
        throw_malformed(kFormat, "frame count overflows the file size", "ValidFrames");
    auto dt = kv.find("DateTime");
    if (dt != kv.end()) h.date_time = dt->second;
    return h;
}

double iqt_scale(double gain_offset, double max_input_level, double level_offset) {
    return std::sqrt(std::pow(10.0, (gain_offset + max_input_level + level_offset) / 10.0) / 20.0 * 2.0);
}

IqtFrameHeader decode_iqt_frame_header(const uint8_t* p) {
    using utils::load_le;
    IqtFrameHeader f;
    f.reserved1 = load_le<int16_t>(p + 0);
    f.valid_a = load_le<int16_t>(p + 2);
    f.valid_p = load_le<int16_t>(p + 4);
    f.valid_i = load_le<int16_t>(p + 6);
    f.valid_q = load_le<int16_t>(p + 8);
    f.bins = load_le<int16_t>(p + 10);
    f.reserved2 = load_le<int16_t>(p + 12);
    f.triggered = load_le<int16_t>(p + 14);
    f.overload = load_le<int16_t>(p + 16);
    f.last_frame = load_le<int16_t>(p + 18);
    f.ticks = load_le<int32_t>(p + 20);
    return f;
}

IqtReader::IqtReader(std::filesystem::path path) : Reader(std::move(path)) {}

void IqtReader::do_probe() {
    auto in = open_stream();
    const auto block = utils::read_prefixed_block(in, kFormat);
    header_ = parse_iqt_header(block.block);

    FrameGeometry geom;
    geom.header_size = block.header_size;
    geom.samples_per_frame = header_.fft_points;
    geom.frame_size = IQT_FRAME_HEADER_SIZE + 4 * static_cast<std::size_t>(header_.fft_points);
    geom.frame_count = header_.valid_frames;

    const uint64_t needed = geom.header_size + geom.frame_count * geom.frame_size;
    const uint64_t size = file_size();
    if (size < needed) {
        throw_structural(kFormat,
                         "file holds " + std::to_string(size) + " bytes, header declares " +
                             std::to_string(geom.frame_count) + " frames needing " + std::to_string(needed),
                         "ValidFrames");
    }

    meta_ = CaptureMetadata{};
    meta_.center_hz = header_.center_frequency;
    meta_.span_hz = header_.span;
    meta_.sample_rate_hz = header_.sample_rate();
    meta_.total_samples = header_.valid_frames * header_.fft_points;
    meta_.date_time = header_.date_time;
    meta_.scale = iqt_scale(header_.gain_offset, header_.max_input_level, header_.level_offset);
    geometry_ = geom;

    IQDEC_LOGF("iqt: header %zu bytes, frame %zu bytes, %llu frames", geom.header_size, geom.frame_size,
               static_cast<unsigned long long>(geom.frame_count));
}

SampleBuffer IqtReader::do_read(const WindowRequest& req) {
    const auto& geom = std::get<FrameGeometry>(geometry_);
    const WindowPlan plan = compute_window(req, {geom.samples_per_frame, geom.frame_count}, kFormat);

    auto in = open_stream();
    const uint64_t offset = geom.header_size + plan.start_unit * geom.frame_size;
    const auto bytes = read_bytes(in, offset, plan.units_needed * geom.frame_size, "frames");

    SampleBuffer all;
    all.reserve(plan.units_needed * geom.samples_per_frame);
    frame_headers_.clear();
    for (uint64_t f = 0; f < plan.units_needed; ++f) {
        const uint8_t* frame = bytes.data() + f * geom.frame_size;
        const IqtFrameHeader fh = decode_iqt_frame_header(frame);
        if (fh.overload) IQDEC_LOGF("iqt: frame %llu overloaded", static_cast<unsigned long long>(plan.start_unit + f + 1));
        frame_headers_.push_back(fh);
        std::span<const uint8_t> data(frame + IQT_FRAME_HEADER_SIZE, geom.frame_size - IQT_FRAME_HEADER_SIZE);
        utils::append_interleaved_bytes<int16_t>(data, utils::ByteOrder::Little, utils::IqOrder::QI, meta_.scale, all);
    }

    const auto first = all.begin() + static_cast<std::ptrdiff_t>(plan.intra_unit_offset);
    return SampleBuffer(first, first + static_cast<std::ptrdiff_t>(plan.total_samples));
}

IqHeaderReader::IqHeaderReader(std::filesystem::path path) : Reader(std::move(path)) {}

void IqHeaderReader::do_probe() {
    auto in = open_stream();
    const auto block = utils::read_prefixed_block(in, format_name());
    header_ = parse_iqt_header(block.block);

    meta_ = CaptureMetadata{};
    meta_.center_hz = header_.center_frequency;
    meta_.span_hz = header_.span;
    meta_.sample_rate_hz = header_.sample_rate();
    meta_.total_samples = header_.valid_frames * header_.fft_points;
    meta_.date_time = header_.date_time;
    geometry_ = std::monostate{};
}

SampleBuffer IqHeaderReader::do_read(const WindowRequest&) {
    throw_structural(format_name(), "sample data is not decoded for .iq files, only the header", "payload");
}

} // namespace iqdec::formats
