#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include "iqdec/formats/reader.hpp"

namespace iqdec::formats {

// Acquisition parameters carried by the TIQ XML block.
struct TiqHeader {
    double acq_bandwidth{0.0};
    double center_frequency{0.0};
    std::string date_time;
    uint64_t number_samples{0};
    double rbw{0.0};
    double rf_attenuation{0.0};
    double sampling_frequency{0.0};
    double span{0.0};
    double scaling{0.0};
};

// Parse the XML block. Tektronix-namespaced elements give the direct fields;
// rbw and span come from <NumericParameter name=".." pid=".."><Value> with
// both attributes matching. Throws DecodeError(MalformedMetadata).
TiqHeader parse_tiq_xml(std::string_view xml);

// Split the leading header. A digit selects <d><d digits><xml>; '<' selects
// the instrument form whose root element carries offset="NNN".
struct TiqFraming {
    std::string xml;
    std::size_t header_size{0};
};
TiqFraming read_tiq_framing(std::istream& in);

// Tektronix TIQ capture: XML header followed by little-endian int32 I,Q pairs.
class TiqReader : public Reader {
public:
    explicit TiqReader(std::filesystem::path path);

    std::string_view format_name() const override { return "tiq"; }

    const TiqHeader& header() const { return header_; }
    // Raw XML block, for callers that archive the header beside the data.
    const std::string& xml() const { return xml_; }

protected:
    void do_probe() override;
    SampleBuffer do_read(const WindowRequest& req) override;

private:
    TiqHeader header_;
    std::string xml_;
};

} // namespace iqdec::formats
