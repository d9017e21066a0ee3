#include "iqdec/formats/wav.hpp"
#include "iqdec/constants.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"
#include "iqdec/utils/byte_order.hpp"
#include "iqdec/utils/normalize.hpp"
#include "iqdec/window.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace iqdec::formats {

namespace {

constexpr const char* kFormat = "wav";

template <std::size_t N>
std::array<uint8_t, N> read_at(std::istream& in, uint64_t offset, const char* field) {
    std::array<uint8_t, N> buf{};
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(N));
    if (static_cast<std::size_t>(in.gcount()) != N)
        throw_io(kFormat, "short read of " + std::to_string(N) + " bytes at offset " + std::to_string(offset), field);
    return buf;
}

std::string chunk_id(const uint8_t* p) { return std::string(reinterpret_cast<const char*>(p), 4); }

WavFormat decode_fmt(std::istream& in, uint64_t offset, uint32_t size) {
    if (size < WAV_FMT_MIN_SIZE) throw_malformed(kFormat, "fmt chunk of " + std::to_string(size) + " bytes", "fmt");
    const auto b = read_at<WAV_FMT_MIN_SIZE>(in, offset, "fmt");
    using utils::load_le;
    WavFormat f;
    f.format_tag = load_le<uint16_t>(b.data());
    f.channels = load_le<uint16_t>(b.data() + 2);
    f.sample_rate = load_le<uint32_t>(b.data() + 4);
    f.block_align = load_le<uint16_t>(b.data() + 12);
    f.bits_per_sample = load_le<uint16_t>(b.data() + 14);
    if (f.format_tag == WAV_FORMAT_EXTENSIBLE) {
        if (size < WAV_FMT_EXTENSIBLE_SIZE)
            throw_malformed(kFormat, "extensible fmt chunk of " + std::to_string(size) + " bytes", "fmt");
        // SubFormat GUID starts with the plain format tag.
        const auto sub = read_at<2>(in, offset + 24, "fmt");
        f.format_tag = load_le<uint16_t>(sub.data());
    }
    return f;
}

} // namespace

const char* to_string(WavEncoding e) {
    switch (e) {
    case WavEncoding::Int16: return "int16";
    case WavEncoding::Int32: return "int32";
    case WavEncoding::Float32: return "float32";
    case WavEncoding::Float64: return "float64";
    }
    return "?";
}

WavLayout parse_wav_layout(std::istream& in, uint64_t file_size) {
    if (file_size < WAV_RIFF_HEADER_SIZE) throw_structural(kFormat, "file shorter than a RIFF header", "riff");
    const auto riff = read_at<WAV_RIFF_HEADER_SIZE>(in, 0, "riff");
    if (chunk_id(riff.data()) != "RIFF" || chunk_id(riff.data() + 8) != "WAVE")
        throw_structural(kFormat, "not a RIFF/WAVE file", "riff");

    WavLayout out;
    bool have_fmt = false;
    uint64_t pos = WAV_RIFF_HEADER_SIZE;
    while (pos + WAV_CHUNK_HEADER_SIZE <= file_size) {
        const auto head = read_at<WAV_CHUNK_HEADER_SIZE>(in, pos, "chunk");
        const std::string id = chunk_id(head.data());
        const uint32_t size = utils::load_le<uint32_t>(head.data() + 4);
        const uint64_t body = pos + WAV_CHUNK_HEADER_SIZE;

        if (id == "fmt ") {
            out.fmt = decode_fmt(in, body, size);
            have_fmt = true;
        } else if (id == "data") {
            if (!have_fmt) throw_structural(kFormat, "data chunk precedes fmt chunk", "fmt");
            out.data_offset = body;
            out.data_size = std::min<uint64_t>(size, file_size - body);
            if (out.data_size != size)
                IQDEC_LOGF("wav: data chunk declares %u bytes, file holds %llu", size,
                           static_cast<unsigned long long>(out.data_size));
            return out;
        } else {
            IQDEC_LOGF("wav: skipping chunk '%s' of %u bytes", id.c_str(), size);
        }
        pos = body + size + (size & 1u);
    }
    throw_structural(kFormat, "no data chunk", "data");
}

WavEncoding wav_encoding(const WavFormat& fmt) {
    if (fmt.channels != 2)
        throw_structural(kFormat, std::to_string(fmt.channels) + " channels, I/Q needs 2", "channels");
    WavEncoding e;
    if (fmt.format_tag == WAV_FORMAT_PCM && fmt.bits_per_sample == 16) e = WavEncoding::Int16;
    else if (fmt.format_tag == WAV_FORMAT_PCM && fmt.bits_per_sample == 32) e = WavEncoding::Int32;
    else if (fmt.format_tag == WAV_FORMAT_IEEE_FLOAT && fmt.bits_per_sample == 32) e = WavEncoding::Float32;
    else if (fmt.format_tag == WAV_FORMAT_IEEE_FLOAT && fmt.bits_per_sample == 64) e = WavEncoding::Float64;
    else
        throw_structural(kFormat,
                         "format tag " + std::to_string(fmt.format_tag) + " with " +
                             std::to_string(fmt.bits_per_sample) + " bits is not supported",
                         "fmt");
    if (fmt.block_align != 2 * fmt.bits_per_sample / 8)
        throw_structural(kFormat, "block align " + std::to_string(fmt.block_align) + " does not match two channels",
                         "block_align");
    return e;
}

WavReader::WavReader(std::filesystem::path path) : Reader(std::move(path)) {}

void WavReader::do_probe() {
    const uint64_t size = file_size();
    auto in = open_stream();
    layout_ = parse_wav_layout(in, size);
    encoding_ = wav_encoding(layout_.fmt);
    if (layout_.fmt.sample_rate == 0) throw_malformed(kFormat, "sample rate is zero", "sample_rate");

    FlatGeometry geom;
    geom.header_size = static_cast<std::size_t>(layout_.data_offset);
    geom.bytes_per_sample = layout_.fmt.block_align;
    geom.sample_count = layout_.data_size / layout_.fmt.block_align;

    meta_ = CaptureMetadata{};
    meta_.sample_rate_hz = layout_.fmt.sample_rate;
    meta_.total_samples = geom.sample_count;
    meta_.date_time = file_time_string();
    geometry_ = geom;

    IQDEC_LOGF("wav: %s pairs at %u sps, data at %zu", to_string(encoding_), layout_.fmt.sample_rate,
               geom.header_size);
}

SampleBuffer WavReader::do_read(const WindowRequest& req) {
    const auto& geom = std::get<FlatGeometry>(geometry_);
    const WindowPlan plan = compute_window(req, {1, geom.sample_count}, kFormat);

    auto in = open_stream();
    const auto bytes = read_bytes(in, geom.header_size + geom.bytes_per_sample * plan.start_sample,
                                  geom.bytes_per_sample * plan.total_samples, "data");
    SampleBuffer out;
    const auto little = utils::ByteOrder::Little;
    const auto iq = utils::IqOrder::IQ;
    switch (encoding_) {
    case WavEncoding::Int16: utils::append_interleaved_bytes<int16_t>(bytes, little, iq, meta_.scale, out); break;
    case WavEncoding::Int32: utils::append_interleaved_bytes<int32_t>(bytes, little, iq, meta_.scale, out); break;
    case WavEncoding::Float32: utils::append_interleaved_bytes<float>(bytes, little, iq, meta_.scale, out); break;
    case WavEncoding::Float64: utils::append_interleaved_bytes<double>(bytes, little, iq, meta_.scale, out); break;
    }
    return out;
}

} // namespace iqdec::formats
