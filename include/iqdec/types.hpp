#pragma once
#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace iqdec {

// Double components keep every 32-bit integer code distinct after scaling.
using Sample = std::complex<double>;
using SampleBuffer = std::vector<Sample>;

struct CaptureMetadata {
    double center_hz{0.0};
    double sample_rate_hz{0.0};
    double span_hz{0.0};
    double rbw_hz{0.0};
    double rf_attenuation_db{0.0};
    double acq_bandwidth_hz{0.0};
    double scale{1.0};          // applied once to raw integer samples
    std::string date_time;      // instrument or file timestamp, human readable
    uint64_t total_samples{0};
};

// Frames are 1-based: start_frame == 1 is the first frame in the file.
struct WindowRequest {
    uint64_t frame_length{1024};
    uint64_t frame_count{10};
    uint64_t start_frame{1};
};

struct ReadResult {
    SampleBuffer samples;
    CaptureMetadata metadata;
};

// Per-format geometry, learned once by probe() and cached by the reader.
struct FrameGeometry {
    std::size_t header_size{0};
    std::size_t frame_size{0};
    uint64_t samples_per_frame{0};
    uint64_t frame_count{0};
};

struct FlatGeometry {
    std::size_t header_size{0};
    std::size_t bytes_per_sample{0};
    uint64_t sample_count{0};
};

struct BlockGeometry {
    std::size_t block_header_size{0};
    std::size_t block_payload_size{0};
    uint64_t block_count{0};
    uint64_t samples_per_block{0};
};

struct SegmentGeometry {
    uint64_t first_record_end{0};
    uint64_t record_stride{0};
    uint64_t samples_per_record{0};
    uint64_t records_per_file{0};
};

using GeometryDescriptor = std::variant<std::monostate, FrameGeometry, FlatGeometry, BlockGeometry, SegmentGeometry>;

inline uint64_t total_frames(const CaptureMetadata& meta, uint64_t frame_length) {
    return frame_length ? meta.total_samples / frame_length : 0;
}

} // namespace iqdec
