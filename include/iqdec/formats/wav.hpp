#pragma once
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string_view>
#include "iqdec/formats/reader.hpp"

namespace iqdec::formats {

// Stereo sample encodings accepted as I/Q.
enum class WavEncoding { Int16, Int32, Float32, Float64 };

const char* to_string(WavEncoding e);

// Fields of the 'fmt ' chunk. format_tag is the SubFormat tag when the file
// uses WAVE_FORMAT_EXTENSIBLE.
struct WavFormat {
    uint16_t format_tag{0};
    uint16_t channels{0};
    uint32_t sample_rate{0};
    uint16_t block_align{0};
    uint16_t bits_per_sample{0};
};

struct WavLayout {
    WavFormat fmt;
    uint64_t data_offset{0};
    uint64_t data_size{0};   // clamped to the bytes present in the file
};

// Walks the RIFF chunk list from the start of `in` up to the 'data' chunk.
// Chunks other than 'fmt ' and 'data' are skipped, odd sizes padded.
// Throws DecodeError (StructuralMismatch for a bad chunk layout,
// MalformedMetadata for a short 'fmt ' chunk, Io for short reads).
WavLayout parse_wav_layout(std::istream& in, uint64_t file_size);

// Maps the fmt chunk to a stereo encoding; throws DecodeError
// (StructuralMismatch) for anything but two 16/32-bit PCM or 32/64-bit float
// channels.
WavEncoding wav_encoding(const WavFormat& fmt);

// Stereo WAV recording: left channel is I, right channel is Q. The sample
// rate comes from the file, the center frequency is 0 and samples are not
// scaled.
class WavReader : public Reader {
public:
    explicit WavReader(std::filesystem::path path);

    std::string_view format_name() const override { return "wav"; }

    const WavLayout& layout() const { return layout_; }
    WavEncoding encoding() const { return encoding_; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;

private:
    WavLayout layout_;
    WavEncoding encoding_{WavEncoding::Int16};
};

} // namespace iqdec::formats
