#include "iqdec/formats/reader.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"

#include <chrono>
#include <ctime>
#include <system_error>

namespace iqdec::formats {

Reader::Reader(std::filesystem::path path) : path_(std::move(path)) {}

const CaptureMetadata& Reader::probe() {
    if (!probed_) {
        do_probe();
        probed_ = true;
        IQDEC_LOGF("%s: probed %s, %llu samples at %.6g sps, center %.6g Hz, scale %.6g",
                   std::string(format_name()).c_str(), path_.string().c_str(),
                   static_cast<unsigned long long>(meta_.total_samples), meta_.sample_rate_hz, meta_.center_hz,
                   meta_.scale);
    }
    return meta_;
}

ReadResult Reader::read(const WindowRequest& req) {
    probe();
    ReadResult out;
    out.samples = do_read(req);
    const uint64_t expected = req.frame_count * req.frame_length;
    if (out.samples.size() != expected) {
        throw_structural(format_name(),
                         "decoded " + std::to_string(out.samples.size()) + " samples, expected " +
                             std::to_string(expected));
    }
    out.metadata = meta_;
    IQDEC_LOGF("%s: read %zu samples", std::string(format_name()).c_str(), out.samples.size());
    return out;
}

std::ifstream Reader::open_stream() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) throw_io(format_name(), "cannot open " + path_.string(), "file");
    return in;
}

uint64_t Reader::file_size() const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) throw_io(format_name(), "cannot stat " + path_.string() + ": " + ec.message(), "file");
    return static_cast<uint64_t>(size);
}

std::vector<uint8_t> Reader::read_bytes(std::ifstream& in, uint64_t offset, std::size_t n, const char* field) const {
    std::vector<uint8_t> buf(n);
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
    if (!in || static_cast<std::size_t>(in.gcount()) != n) {
        throw_io(format_name(),
                 "short read of " + std::to_string(n) + " bytes at offset " + std::to_string(offset), field);
    }
    return buf;
}

std::string Reader::file_time_string() const {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path_, ec);
    if (ec) return {};
    const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    const std::time_t t = std::chrono::system_clock::to_time_t(sys);
    std::tm local{};
    if (!localtime_r(&t, &local)) return {};
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%a %b %d %H:%M:%S %Y", &local) == 0) return {};
    return buf;
}

} // namespace iqdec::formats
