#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>
#include "iqdec/constants.hpp"
#include "iqdec/formats/reader.hpp"
#include "iqdec/utils/bcd.hpp"

namespace iqdec::formats {

// Block grid and acquisition constants of a TCAP recording. The defaults are
// the instrument's fixed configuration; tests shrink block_count.
struct TcapLayout {
    std::size_t block_header_size{TCAP_BLOCK_HEADER_SIZE};
    std::size_t block_payload_size{TCAP_BLOCK_PAYLOAD_SIZE};
    uint64_t block_count{TCAP_BLOCK_COUNT};
    double sample_rate_hz{312500.0};
    double center_hz{1.6e5};
    double span_hz{312500.0};
    double scale{6.25e-2};

    std::size_t block_size() const { return block_header_size + block_payload_size; }
    uint64_t samples_per_block() const { return block_payload_size / TCAP_BYTES_PER_SAMPLE; }
    uint64_t expected_file_size() const { return block_count * block_size(); }
};

struct ByteRange {
    uint64_t offset{0};
    std::size_t length{0};
};

// File ranges holding payload bytes [payload_start, payload_start + length)
// of the block grid, one range per block touched. Consecutive ranges are
// separated by exactly one block header.
std::vector<ByteRange> plan_block_copy(uint64_t payload_start, uint64_t length, const TcapLayout& layout);

// Regions of the first block header, captured verbatim.
struct TcapHeaderRegion {
    std::array<uint8_t, TCAP_TIME_REGISTER_SIZE> time_register{};
    std::array<uint8_t, TCAP_PIO_SIZE> pio{};
    std::array<uint8_t, TCAP_SCALER_TABLE_SIZE> scalers{};
    utils::BcdTimestamp time;
};

// TCAP .dat recording: fixed grid of blocks, each an 88 byte header and a
// payload of big-endian int16 I,Q pairs.
class TcapReader : public Reader {
public:
    explicit TcapReader(std::filesystem::path path, TcapLayout layout = {});

    std::string_view format_name() const override { return "tcap"; }

    const TcapLayout& layout() const { return layout_; }
    const TcapHeaderRegion& header_region() const { return region_; }
    // Block headers stepped over by the most recent read().
    std::size_t last_headers_skipped() const { return headers_skipped_; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;

private:
    TcapLayout layout_;
    TcapHeaderRegion region_;
    std::size_t headers_skipped_{0};
};

} // namespace iqdec::formats
