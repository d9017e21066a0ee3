#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>
#include "iqdec/types.hpp"

namespace iqdec::formats {

// Common contract of every capture format: probe() learns metadata and
// geometry once, read() decodes one window into scaled complex samples.
// A reader serves one file and one caller.
class Reader {
public:
    explicit Reader(std::filesystem::path path);
    virtual ~Reader() = default;

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    virtual std::string_view format_name() const = 0;

    // Idempotent; the first call scans the file, later calls return the cache.
    const CaptureMetadata& probe();
    bool probed() const { return probed_; }

    // Valid after probe().
    const CaptureMetadata& metadata() const { return meta_; }
    const GeometryDescriptor& geometry() const { return geometry_; }

    // Probes first when needed. Returns exactly frame_count * frame_length
    // samples or throws DecodeError.
    ReadResult read(const WindowRequest& req);

    const std::filesystem::path& path() const { return path_; }

protected:
    virtual void do_probe() = 0;
    virtual SampleBuffer do_read(const WindowRequest& req) = 0;

    std::ifstream open_stream() const;
    uint64_t file_size() const;
    // Reads exactly n bytes at absolute offset; throws Io when the file is short.
    std::vector<uint8_t> read_bytes(std::ifstream& in, uint64_t offset, std::size_t n, const char* field) const;
    // Last modification time of the file, ctime style.
    std::string file_time_string() const;

    CaptureMetadata meta_;
    GeometryDescriptor geometry_;

private:
    std::filesystem::path path_;
    bool probed_{false};
};

} // namespace iqdec::formats
