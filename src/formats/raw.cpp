#include "iqdec/formats/raw.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"
#include "iqdec/utils/normalize.hpp"
#include "iqdec/window.hpp"

#include <cstdlib>
#include <iterator>
#include <sstream>
#include <string>

namespace iqdec::formats {

namespace {
constexpr std::size_t kComplex64Size = 8;
}

void RawBinReader::do_probe() {
    const uint64_t size = file_size();
    if (size < kComplex64Size || size % kComplex64Size != 0)
        throw_structural(format_name(), "file is not a whole number of complex64 values", "file_size");

    auto in = open_stream();
    const auto first = read_bytes(in, 0, kComplex64Size, "sample_rate");

    FlatGeometry geom;
    geom.header_size = kComplex64Size;
    geom.bytes_per_sample = kComplex64Size;
    geom.sample_count = size / kComplex64Size - 1;

    meta_ = CaptureMetadata{};
    meta_.sample_rate_hz = utils::load_le<float>(first.data());
    meta_.center_hz = utils::load_le<float>(first.data() + 4);
    meta_.total_samples = geom.sample_count;
    meta_.date_time = file_time_string();
    geometry_ = geom;
}

SampleBuffer RawBinReader::do_read(const WindowRequest& req) {
    const auto& geom = std::get<FlatGeometry>(geometry_);
    const WindowPlan plan = compute_window(req, {1, geom.sample_count}, format_name());

    auto in = open_stream();
    const auto bytes = read_bytes(in, geom.header_size + geom.bytes_per_sample * plan.start_sample,
                                  geom.bytes_per_sample * plan.total_samples, "payload");
    SampleBuffer out;
    utils::append_interleaved_bytes<float>(bytes, utils::ByteOrder::Little, utils::IqOrder::IQ, meta_.scale, out);
    return out;
}

std::vector<std::pair<double, double>> AsciiReader::load_rows() const {
    auto in = open_stream();
    std::vector<std::pair<double, double>> rows;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
        for (char& ch : line)
            if (ch == ',') ch = ' ';
        std::istringstream fields(line);
        std::vector<std::string> tok{std::istream_iterator<std::string>(fields), std::istream_iterator<std::string>()};
        if (tok.empty()) continue;
        if (tok.size() != 2)
            throw_malformed(format_name(), "expected two columns on line " + std::to_string(lineno), "line");
        double v[2];
        for (int k = 0; k < 2; ++k) {
            char* end = nullptr;
            v[k] = std::strtod(tok[k].c_str(), &end);
            if (end != tok[k].c_str() + tok[k].size())
                throw_malformed(format_name(), "non-numeric value '" + tok[k] + "' on line " + std::to_string(lineno),
                                "line");
        }
        rows.emplace_back(v[0], v[1]);
    }
    if (rows.empty()) throw_malformed(format_name(), "no sample rate row", "sample_rate");
    return rows;
}

void AsciiReader::do_probe() {
    const auto rows = load_rows();

    FlatGeometry geom;
    geom.sample_count = rows.size() - 1;

    meta_ = CaptureMetadata{};
    meta_.sample_rate_hz = rows.front().first;
    meta_.center_hz = rows.front().second;
    meta_.total_samples = geom.sample_count;
    meta_.date_time = file_time_string();
    geometry_ = geom;
}

SampleBuffer AsciiReader::do_read(const WindowRequest& req) {
    const auto& geom = std::get<FlatGeometry>(geometry_);
    const WindowPlan plan = compute_window(req, {1, geom.sample_count}, format_name());

    const auto rows = load_rows();
    if (rows.size() - 1 != geom.sample_count)
        throw_structural(format_name(), "file changed since probe", "line");
    SampleBuffer out;
    out.reserve(plan.total_samples);
    for (uint64_t k = 0; k < plan.total_samples; ++k) {
        const auto& r = rows[1 + plan.start_sample + k];
        out.emplace_back(r.first * meta_.scale, r.second * meta_.scale);
    }
    IQDEC_LOGF("ascii: %zu rows parsed", rows.size());
    return out;
}

} // namespace iqdec::formats
