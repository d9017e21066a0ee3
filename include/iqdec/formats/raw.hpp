#pragma once
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <utility>
#include <vector>
#include "iqdec/formats/reader.hpp"

namespace iqdec::formats {

// Little-endian complex64 stream; element 0 carries (sample rate, center).
class RawBinReader : public Reader {
public:
    using Reader::Reader;
    std::string_view format_name() const override { return "bin"; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;
};

// Two columns of text, separated by blanks or commas. Row 0 carries
// (sample rate, center); later rows are (I, Q). '#' starts a comment.
class AsciiReader : public Reader {
public:
    using Reader::Reader;
    std::string_view format_name() const override { return "ascii"; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;

private:
    std::vector<std::pair<double, double>> load_rows() const;
};

} // namespace iqdec::formats
