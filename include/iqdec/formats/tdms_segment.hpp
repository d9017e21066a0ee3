#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "iqdec/utils/byte_order.hpp"

namespace iqdec::formats {

// TDMS data type codes (tdsDataType).
enum class TdmsType : uint32_t {
    Void = 0x00,
    I8 = 0x01,
    I16 = 0x02,
    I32 = 0x03,
    I64 = 0x04,
    U8 = 0x05,
    U16 = 0x06,
    U32 = 0x07,
    U64 = 0x08,
    SingleFloat = 0x09,
    DoubleFloat = 0x0A,
    ExtendedFloat = 0x0B,
    SingleFloatWithUnit = 0x19,
    DoubleFloatWithUnit = 0x1A,
    String = 0x20,
    Boolean = 0x21,
    TimeStamp = 0x44,
    ComplexSingleFloat = 0x08000C,
    ComplexDoubleFloat = 0x10000D,
};

// Size in bytes of one raw value; 0 for strings and unknown codes.
std::size_t tdms_type_size(TdmsType type);
const char* to_string(TdmsType type);

// Seconds since 1904-01-01 UTC plus a 2^-64 fraction.
struct TdmsTimestamp {
    int64_t seconds{0};
    uint64_t fraction{0};
};

using TdmsValue = std::variant<int64_t, uint64_t, double, std::string, bool, TdmsTimestamp>;

// Numeric value of a property, also accepting numeric text.
std::optional<double> tdms_value_as_double(const TdmsValue& v);

struct TdmsRawIndex {
    TdmsType type{TdmsType::Void};
    uint32_t dimension{1};
    uint64_t value_count{0};
    uint64_t total_size{0}; // strings only
};

struct TdmsObject {
    std::string path;
    std::map<std::string, TdmsValue, std::less<>> properties;
    std::optional<TdmsRawIndex> index; // last raw index seen for this object
};

// Raw values of one channel accumulated across segments, little-endian.
struct TdmsChannel {
    TdmsType type{TdmsType::Void};
    std::vector<uint8_t> bytes;

    std::size_t size() const {
        const std::size_t w = tdms_type_size(type);
        return w ? bytes.size() / w : 0;
    }

    template <typename T>
    std::vector<T> values() const {
        check_width(sizeof(T));
        std::vector<T> out(bytes.size() / sizeof(T));
        if (!out.empty()) std::memcpy(out.data(), bytes.data(), out.size() * sizeof(T));
        return out;
    }

    template <typename T>
    std::optional<T> last() const {
        check_width(sizeof(T));
        if (bytes.size() < sizeof(T)) return std::nullopt;
        return utils::load_le<T>(bytes.data() + bytes.size() - sizeof(T));
    }

private:
    void check_width(std::size_t width) const;
};

// Lead-in of one segment.
struct TdmsLeadIn {
    uint32_t toc{0};
    uint32_t version{0};
    uint64_t next_segment_offset{0};
    uint64_t raw_data_offset{0};
};

// Incremental TDMS segment reader. Object properties and the active object
// list carry over between segments; raw data of every channel is appended
// to its TdmsChannel. The caller owns the stream.
class TdmsSegmentParser {
public:
    TdmsSegmentParser(std::istream& in, uint64_t file_size, std::string_view format = "tdms");

    // Parses the segment starting at position() and moves position() to its
    // end. Returns false when position() is already at end of file.
    bool next_segment();

    // Moves to an absolute segment start without parsing what lies between.
    void seek(uint64_t offset);

    uint64_t position() const { return pos_; }
    std::size_t segments_parsed() const { return segments_; }
    const TdmsLeadIn& last_lead_in() const { return lead_in_; }

    const TdmsObject* object(std::string_view path) const;
    const TdmsChannel* channel(std::string_view path) const;
    const std::map<std::string, TdmsObject, std::less<>>& objects() const { return objects_; }

private:
    struct ActiveEntry {
        std::string path;
        bool has_data{false};
    };

    void parse_metadata(const std::vector<uint8_t>& meta, utils::ByteOrder order, bool new_list);
    void parse_raw(const std::vector<uint8_t>& raw, utils::ByteOrder order, bool interleaved);
    void append_values(const std::string& path, const TdmsRawIndex& idx, const uint8_t* p, uint64_t count,
                       utils::ByteOrder order);

    std::istream& in_;
    uint64_t file_size_;
    std::string format_;
    uint64_t pos_{0};
    std::size_t segments_{0};
    TdmsLeadIn lead_in_;
    std::map<std::string, TdmsObject, std::less<>> objects_;
    std::vector<ActiveEntry> active_;
    std::map<std::string, TdmsChannel, std::less<>> channels_;
};

} // namespace iqdec::formats
