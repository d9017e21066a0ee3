#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "iqdec/formats/reader.hpp"

namespace iqdec::formats {

// Typed view of the IQT text header. Numeric fields accept the k/m/u/M unit
// suffixes; DateTime is kept verbatim.
struct IqtHeader {
    uint32_t fft_points{0};
    double max_input_level{0.0};
    double level_offset{0.0};
    double frame_length{0.0};   // seconds per frame
    double gain_offset{0.0};
    double center_frequency{0.0};
    double span{0.0};
    uint64_t valid_frames{0};
    std::string date_time;

    double sample_rate() const { return frame_length > 0.0 ? fft_points / frame_length : 0.0; }
};

// Parse "key = value" header text; throws DecodeError(MalformedMetadata)
// naming the missing or non-numeric field.
IqtHeader parse_iqt_header(std::string_view text);

// Linear scale from the three header gain terms:
// sqrt(10^((gain_offset + max_input_level + level_offset) / 10) / 20 * 2)
double iqt_scale(double gain_offset, double max_input_level, double level_offset);

struct IqtFrameHeader {
    int16_t reserved1{0};
    int16_t valid_a{0};
    int16_t valid_p{0};
    int16_t valid_i{0};
    int16_t valid_q{0};
    int16_t bins{0};
    int16_t reserved2{0};
    int16_t triggered{0};
    int16_t overload{0};
    int16_t last_frame{0};
    int32_t ticks{0};
};

// Decode the 24 byte little-endian frame header at p.
IqtFrameHeader decode_iqt_frame_header(const uint8_t* p);

// Sony/Tektronix IQT capture: length-prefixed text header followed by fixed
// size frames, each a frame header plus FFTPoints interleaved Q,I int16 pairs.
class IqtReader : public Reader {
public:
    explicit IqtReader(std::filesystem::path path);

    std::string_view format_name() const override { return "iqt"; }

    const IqtHeader& header() const { return header_; }
    // Frame headers of the frames touched by the most recent read().
    const std::vector<IqtFrameHeader>& last_frame_headers() const { return frame_headers_; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;

private:
    IqtHeader header_;
    std::vector<IqtFrameHeader> frame_headers_;
};

// Sony/Tektronix .iq file: the same length-prefixed header as IQT, without a
// decodable payload. probe() fills center, span, sample rate, sample count
// and DateTime; read() throws DecodeError(StructuralMismatch).
class IqHeaderReader : public Reader {
public:
    explicit IqHeaderReader(std::filesystem::path path);

    std::string_view format_name() const override { return "iq"; }

    const IqtHeader& header() const { return header_; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;

private:
    IqtHeader header_;
};

} // namespace iqdec::formats
