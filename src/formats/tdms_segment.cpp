#include "iqdec/formats/tdms_segment.hpp"
#include "iqdec/constants.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"
#include "iqdec/utils/text_header.hpp"

#include <algorithm>
#include <cstdlib>

namespace iqdec::formats {

using utils::ByteOrder;

namespace {

constexpr uint32_t kDaqmxFormatChanging = 0x69120000u;
constexpr uint32_t kDaqmxDigitalLine = 0x69130000u;

// Bounds-checked reader over one metadata block.
class Cursor {
public:
    Cursor(const std::vector<uint8_t>& buf, ByteOrder order, std::string_view format)
        : buf_(buf), order_(order), format_(format) {}

    template <typename T>
    T get(const std::string& field) {
        need(sizeof(T), field);
        const T v = utils::load<T>(buf_.data() + off_, order_);
        off_ += sizeof(T);
        return v;
    }

    std::string str(const std::string& field) {
        const uint32_t n = get<uint32_t>(field);
        need(n, field);
        std::string s(reinterpret_cast<const char*>(buf_.data() + off_), n);
        off_ += n;
        return s;
    }

    ByteOrder order() const { return order_; }

private:
    void need(std::size_t n, const std::string& field) const {
        if (buf_.size() - off_ < n) throw_structural(format_, "metadata overruns its segment", field);
    }

    const std::vector<uint8_t>& buf_;
    ByteOrder order_;
    std::string_view format_;
    std::size_t off_{0};
};

TdmsValue read_property(Cursor& c, TdmsType type, const std::string& name, std::string_view format) {
    switch (type) {
    case TdmsType::I8: return static_cast<int64_t>(c.get<int8_t>(name));
    case TdmsType::I16: return static_cast<int64_t>(c.get<int16_t>(name));
    case TdmsType::I32: return static_cast<int64_t>(c.get<int32_t>(name));
    case TdmsType::I64: return c.get<int64_t>(name);
    case TdmsType::U8: return static_cast<uint64_t>(c.get<uint8_t>(name));
    case TdmsType::U16: return static_cast<uint64_t>(c.get<uint16_t>(name));
    case TdmsType::U32: return static_cast<uint64_t>(c.get<uint32_t>(name));
    case TdmsType::U64: return c.get<uint64_t>(name);
    case TdmsType::SingleFloat:
    case TdmsType::SingleFloatWithUnit: return static_cast<double>(c.get<float>(name));
    case TdmsType::DoubleFloat:
    case TdmsType::DoubleFloatWithUnit: return c.get<double>(name);
    case TdmsType::String: return c.str(name);
    case TdmsType::Boolean: return c.get<uint8_t>(name) != 0;
    case TdmsType::TimeStamp: {
        TdmsTimestamp ts;
        if (c.order() == ByteOrder::Little) {
            ts.fraction = c.get<uint64_t>(name);
            ts.seconds = c.get<int64_t>(name);
        } else {
            ts.seconds = c.get<int64_t>(name);
            ts.fraction = c.get<uint64_t>(name);
        }
        return ts;
    }
    default:
        throw_structural(format, std::string("unsupported property type ") + to_string(type), name);
    }
}

} // namespace

std::size_t tdms_type_size(TdmsType type) {
    switch (type) {
    case TdmsType::I8:
    case TdmsType::U8:
    case TdmsType::Boolean: return 1;
    case TdmsType::I16:
    case TdmsType::U16: return 2;
    case TdmsType::I32:
    case TdmsType::U32:
    case TdmsType::SingleFloat:
    case TdmsType::SingleFloatWithUnit: return 4;
    case TdmsType::I64:
    case TdmsType::U64:
    case TdmsType::DoubleFloat:
    case TdmsType::DoubleFloatWithUnit:
    case TdmsType::ComplexSingleFloat: return 8;
    case TdmsType::ExtendedFloat:
    case TdmsType::TimeStamp:
    case TdmsType::ComplexDoubleFloat: return 16;
    default: return 0;
    }
}

const char* to_string(TdmsType type) {
    switch (type) {
    case TdmsType::Void: return "void";
    case TdmsType::I8: return "i8";
    case TdmsType::I16: return "i16";
    case TdmsType::I32: return "i32";
    case TdmsType::I64: return "i64";
    case TdmsType::U8: return "u8";
    case TdmsType::U16: return "u16";
    case TdmsType::U32: return "u32";
    case TdmsType::U64: return "u64";
    case TdmsType::SingleFloat: return "f32";
    case TdmsType::DoubleFloat: return "f64";
    case TdmsType::ExtendedFloat: return "ext";
    case TdmsType::SingleFloatWithUnit: return "f32_unit";
    case TdmsType::DoubleFloatWithUnit: return "f64_unit";
    case TdmsType::String: return "string";
    case TdmsType::Boolean: return "bool";
    case TdmsType::TimeStamp: return "timestamp";
    case TdmsType::ComplexSingleFloat: return "complex64";
    case TdmsType::ComplexDoubleFloat: return "complex128";
    }
    return "unknown";
}

std::optional<double> tdms_value_as_double(const TdmsValue& v) {
    if (const auto* x = std::get_if<int64_t>(&v)) return static_cast<double>(*x);
    if (const auto* x = std::get_if<uint64_t>(&v)) return static_cast<double>(*x);
    if (const auto* x = std::get_if<double>(&v)) return *x;
    if (const auto* s = std::get_if<std::string>(&v)) {
        const std::string text(utils::trim(*s));
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        const double d = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) return std::nullopt;
        return d;
    }
    return std::nullopt;
}

void TdmsChannel::check_width(std::size_t width) const {
    if (tdms_type_size(type) != width) {
        throw DecodeError(ErrorKind::StructuralMismatch, "tdms",
                          std::string("channel holds ") + to_string(type) + " values, not " +
                              std::to_string(width) + "-byte values");
    }
}

TdmsSegmentParser::TdmsSegmentParser(std::istream& in, uint64_t file_size, std::string_view format)
    : in_(in), file_size_(file_size), format_(format) {}

void TdmsSegmentParser::seek(uint64_t offset) {
    if (offset > file_size_) throw_structural(format_, "seek beyond end of file", "segment_offset");
    pos_ = offset;
}

const TdmsObject* TdmsSegmentParser::object(std::string_view path) const {
    auto it = objects_.find(path);
    return it == objects_.end() ? nullptr : &it->second;
}

const TdmsChannel* TdmsSegmentParser::channel(std::string_view path) const {
    auto it = channels_.find(path);
    return it == channels_.end() ? nullptr : &it->second;
}

bool TdmsSegmentParser::next_segment() {
    if (pos_ >= file_size_) return false;
    if (file_size_ - pos_ < TDMS_LEAD_IN_SIZE) throw_structural(format_, "truncated segment lead-in", "lead_in");

    auto read_exact = [&](uint64_t offset, uint64_t n, const char* field) {
        std::vector<uint8_t> buf(static_cast<std::size_t>(n));
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        in_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
        if (!in_ || static_cast<uint64_t>(in_.gcount()) != n)
            throw_io(format_, "short read of " + std::to_string(n) + " bytes at offset " + std::to_string(offset), field);
        return buf;
    };

    const auto head = read_exact(pos_, TDMS_LEAD_IN_SIZE, "lead_in");
    if (std::memcmp(head.data(), "TDSm", 4) != 0)
        throw_structural(format_, "missing TDSm tag at offset " + std::to_string(pos_), "tag");

    TdmsLeadIn li;
    li.toc = utils::load_le<uint32_t>(head.data() + 4);
    const ByteOrder order = (li.toc & TDMS_TOC_BIG_ENDIAN) ? ByteOrder::Big : ByteOrder::Little;
    li.version = utils::load<uint32_t>(head.data() + 8, order);
    li.next_segment_offset = utils::load<uint64_t>(head.data() + 12, order);
    li.raw_data_offset = utils::load<uint64_t>(head.data() + 20, order);
    lead_in_ = li;

    if (li.toc & TDMS_TOC_DAQMX_RAW) throw_structural(format_, "DAQmx raw data is not supported", "toc");

    const uint64_t data_start = pos_ + TDMS_LEAD_IN_SIZE;
    uint64_t end = file_size_;
    if (li.next_segment_offset != ~uint64_t{0}) {
        if (li.next_segment_offset > file_size_ - data_start)
            throw_structural(format_, "segment extends beyond end of file", "next_segment_offset");
        end = data_start + li.next_segment_offset;
    }
    if (li.raw_data_offset > end - data_start)
        throw_structural(format_, "raw data offset beyond segment end", "raw_data_offset");

    if (li.toc & TDMS_TOC_META_DATA) {
        const auto meta = read_exact(data_start, li.raw_data_offset, "metadata");
        parse_metadata(meta, order, (li.toc & TDMS_TOC_NEW_OBJ_LIST) != 0);
    }
    if (li.toc & TDMS_TOC_RAW_DATA) {
        const uint64_t raw_start = data_start + li.raw_data_offset;
        const auto raw = read_exact(raw_start, end - raw_start, "raw_data");
        parse_raw(raw, order, (li.toc & TDMS_TOC_INTERLEAVED) != 0);
    }

    IQDEC_LOGF("tdms: segment %zu at %llu, toc 0x%x, ends at %llu", segments_,
               static_cast<unsigned long long>(pos_), li.toc, static_cast<unsigned long long>(end));
    pos_ = end;
    ++segments_;
    return true;
}

void TdmsSegmentParser::parse_metadata(const std::vector<uint8_t>& meta, ByteOrder order, bool new_list) {
    Cursor c(meta, order, format_);
    if (new_list) active_.clear();

    const uint32_t n_objects = c.get<uint32_t>("object_count");
    for (uint32_t k = 0; k < n_objects; ++k) {
        const std::string path = c.str("object_path");
        TdmsObject& obj = objects_[path];
        obj.path = path;

        const uint32_t raw_index = c.get<uint32_t>(path);
        bool has_data = false;
        if (raw_index == TDMS_NO_RAW_DATA) {
            has_data = false;
        } else if (raw_index == TDMS_SAME_RAW_INDEX) {
            if (!obj.index) throw_structural(format_, "raw index refers to an earlier index that was never given", path);
            has_data = true;
        } else if (raw_index == kDaqmxFormatChanging || raw_index == kDaqmxDigitalLine) {
            throw_structural(format_, "DAQmx raw data is not supported", path);
        } else {
            TdmsRawIndex idx;
            idx.type = static_cast<TdmsType>(c.get<uint32_t>(path));
            idx.dimension = c.get<uint32_t>(path);
            idx.value_count = c.get<uint64_t>(path);
            if (idx.type == TdmsType::String) idx.total_size = c.get<uint64_t>(path);
            else if (tdms_type_size(idx.type) == 0)
                throw_structural(format_, std::string("unsupported raw data type ") + to_string(idx.type), path);
            if (idx.dimension != 1) throw_structural(format_, "raw data dimension must be 1", path);
            obj.index = idx;
            has_data = true;
        }

        auto it = std::find_if(active_.begin(), active_.end(), [&](const ActiveEntry& e) { return e.path == path; });
        if (it == active_.end()) active_.push_back({path, has_data});
        else it->has_data = has_data;

        const uint32_t n_props = c.get<uint32_t>(path);
        for (uint32_t p = 0; p < n_props; ++p) {
            std::string name = c.str(path);
            const auto type = static_cast<TdmsType>(c.get<uint32_t>(name));
            obj.properties[name] = read_property(c, type, name, format_);
        }
    }
}

void TdmsSegmentParser::parse_raw(const std::vector<uint8_t>& raw, ByteOrder order, bool interleaved) {
    if (raw.empty()) return;

    struct Slot {
        const std::string* path;
        TdmsRawIndex index;
        uint64_t bytes;
    };
    std::vector<Slot> slots;
    uint64_t chunk = 0;
    for (const auto& e : active_) {
        if (!e.has_data) continue;
        const TdmsRawIndex& idx = *objects_.at(e.path).index;
        const uint64_t bytes = idx.type == TdmsType::String ? idx.total_size : idx.value_count * tdms_type_size(idx.type);
        slots.push_back({&e.path, idx, bytes});
        chunk += bytes;
    }
    if (chunk == 0) throw_structural(format_, "raw data present but no channel carries data", "raw_data");
    if (raw.size() % chunk != 0) throw_structural(format_, "raw data is not a whole number of chunks", "raw_data");
    const uint64_t n_chunks = raw.size() / chunk;

    if (!interleaved) {
        uint64_t off = 0;
        for (uint64_t k = 0; k < n_chunks; ++k) {
            for (const auto& s : slots) {
                if (s.index.type != TdmsType::String)
                    append_values(*s.path, s.index, raw.data() + off, s.index.value_count, order);
                off += s.bytes;
            }
        }
        return;
    }

    uint64_t stride = 0;
    for (const auto& s : slots) {
        if (s.index.type == TdmsType::String)
            throw_structural(format_, "interleaved raw data cannot hold strings", *s.path);
        if (s.index.value_count != slots.front().index.value_count)
            throw_structural(format_, "interleaved channels differ in value count", *s.path);
        stride += tdms_type_size(s.index.type);
    }
    const uint64_t count = slots.front().index.value_count;
    std::vector<uint8_t> gathered;
    uint64_t lane = 0;
    for (const auto& s : slots) {
        const std::size_t w = tdms_type_size(s.index.type);
        gathered.resize(static_cast<std::size_t>(count * w));
        for (uint64_t k = 0; k < n_chunks; ++k) {
            const uint8_t* base = raw.data() + k * chunk;
            for (uint64_t v = 0; v < count; ++v)
                std::memcpy(gathered.data() + v * w, base + v * stride + lane, w);
            append_values(*s.path, s.index, gathered.data(), count, order);
        }
        lane += w;
    }
}

void TdmsSegmentParser::append_values(const std::string& path, const TdmsRawIndex& idx, const uint8_t* p,
                                      uint64_t count, ByteOrder order) {
    TdmsChannel& ch = channels_[path];
    if (ch.type == TdmsType::Void) ch.type = idx.type;
    else if (ch.type != idx.type) throw_structural(format_, "channel data type changed between segments", path);

    const std::size_t w = tdms_type_size(idx.type);
    const std::size_t n = static_cast<std::size_t>(count * w);
    const std::size_t old = ch.bytes.size();
    ch.bytes.insert(ch.bytes.end(), p, p + n);
    if (order == ByteOrder::Big && w > 1) {
        const bool complex = idx.type == TdmsType::ComplexSingleFloat || idx.type == TdmsType::ComplexDoubleFloat;
        const std::size_t unit = complex ? w / 2 : w;
        for (std::size_t k = old; k < ch.bytes.size(); k += unit)
            std::reverse(ch.bytes.begin() + k, ch.bytes.begin() + k + unit);
    }
}

} // namespace iqdec::formats
