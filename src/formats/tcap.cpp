#include "iqdec/formats/tcap.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"
#include "iqdec/utils/normalize.hpp"
#include "iqdec/window.hpp"

#include <algorithm>
#include <cstring>

namespace iqdec::formats {

namespace {
constexpr const char* kFormat = "tcap";
}

std::vector<ByteRange> plan_block_copy(uint64_t payload_start, uint64_t length, const TcapLayout& layout) {
    std::vector<ByteRange> ranges;
    uint64_t p = payload_start;
    uint64_t remaining = length;
    while (remaining > 0) {
        const uint64_t block = p / layout.block_payload_size;
        const uint64_t within = p % layout.block_payload_size;
        const uint64_t chunk = std::min<uint64_t>(remaining, layout.block_payload_size - within);
        ranges.push_back({block * layout.block_size() + layout.block_header_size + within, static_cast<std::size_t>(chunk)});
        p += chunk;
        remaining -= chunk;
    }
    return ranges;
}

TcapReader::TcapReader(std::filesystem::path path, TcapLayout layout)
    : Reader(std::move(path)), layout_(layout) {}

void TcapReader::do_probe() {
    if (layout_.block_payload_size == 0 || layout_.block_payload_size % TCAP_BYTES_PER_SAMPLE != 0)
        throw_structural(kFormat, "block payload must hold whole I/Q pairs", "block_payload_size");
    if (layout_.block_header_size < TCAP_TIME_REGISTER_SIZE + TCAP_PIO_SIZE + TCAP_SCALER_TABLE_SIZE)
        throw_structural(kFormat, "block header too small for time register, PIO and scalers", "block_header_size");

    const uint64_t size = file_size();
    if (size != layout_.expected_file_size()) {
        throw_structural(kFormat,
                         "file size " + std::to_string(size) + " does not match " +
                             std::to_string(layout_.block_count) + " blocks of " +
                             std::to_string(layout_.block_size()) + " bytes",
                         "file_size");
    }

    auto in = open_stream();
    const auto head = read_bytes(in, 0, TCAP_TIME_REGISTER_SIZE + TCAP_PIO_SIZE + TCAP_SCALER_TABLE_SIZE, "header");
    const uint8_t* p = head.data();
    std::memcpy(region_.time_register.data(), p, TCAP_TIME_REGISTER_SIZE);
    p += TCAP_TIME_REGISTER_SIZE;
    std::memcpy(region_.pio.data(), p, TCAP_PIO_SIZE);
    p += TCAP_PIO_SIZE;
    std::memcpy(region_.scalers.data(), p, TCAP_SCALER_TABLE_SIZE);
    region_.time = utils::decode_bcd_timestamp(region_.time_register);

    BlockGeometry geom;
    geom.block_header_size = layout_.block_header_size;
    geom.block_payload_size = layout_.block_payload_size;
    geom.block_count = layout_.block_count;
    geom.samples_per_block = layout_.samples_per_block();

    meta_ = CaptureMetadata{};
    meta_.sample_rate_hz = layout_.sample_rate_hz;
    meta_.center_hz = layout_.center_hz;
    meta_.span_hz = layout_.span_hz;
    meta_.scale = layout_.scale;
    meta_.total_samples = geom.block_count * geom.samples_per_block;
    meta_.date_time = region_.time.to_string();
    geometry_ = geom;
}

SampleBuffer TcapReader::do_read(const WindowRequest& req) {
    const auto& geom = std::get<BlockGeometry>(geometry_);
    const WindowPlan plan = compute_window(req, {geom.samples_per_block, geom.block_count}, kFormat);

    const auto ranges = plan_block_copy(plan.start_sample * TCAP_BYTES_PER_SAMPLE,
                                        plan.total_samples * TCAP_BYTES_PER_SAMPLE, layout_);
    headers_skipped_ = ranges.empty() ? 0 : ranges.size() - 1;

    auto in = open_stream();
    SampleBuffer out;
    out.reserve(plan.total_samples);
    for (std::size_t r = 0; r < ranges.size(); ++r) {
        if (r > 0) {
            IQDEC_LOGF("tcap: skipping header of block %llu",
                       static_cast<unsigned long long>(ranges[r].offset / layout_.block_size()));
        }
        const auto bytes = read_bytes(in, ranges[r].offset, ranges[r].length, "payload");
        utils::append_interleaved_bytes<int16_t>(bytes, utils::ByteOrder::Big, utils::IqOrder::IQ, meta_.scale, out);
    }
    IQDEC_LOGF("tcap: %zu ranges, %zu headers skipped", ranges.size(), headers_skipped_);
    return out;
}

} // namespace iqdec::formats
