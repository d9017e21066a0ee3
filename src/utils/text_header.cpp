#include "iqdec/utils/text_header.hpp"
#include "iqdec/error.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace iqdec::utils {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<uint64_t> to_count(double v) {
    // 2^64, the first double that does not fit
    constexpr double kLimit = 18446744073709551616.0;
    if (!(v >= 0.0) || v >= kLimit || v != std::floor(v)) return std::nullopt;
    return static_cast<uint64_t>(v);
}

bool append_decimal_digit(uint64_t& value, char digit) {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    const auto d = static_cast<uint64_t>(digit - '0');
    if (value > (kMax - d) / 10) return false;
    value = value * 10 + d;
    return true;
}

std::optional<uint64_t> remaining_bytes(std::istream& in) {
    const std::istream::pos_type here = in.tellg();
    if (here == std::istream::pos_type(-1)) return std::nullopt;
    in.seekg(0, std::ios::end);
    const std::istream::pos_type end = in.tellg();
    in.seekg(here);
    if (end == std::istream::pos_type(-1) || !in) {
        in.clear();
        in.seekg(here);
        return std::nullopt;
    }
    return static_cast<uint64_t>(end - here);
}

static void replace_all(std::string& s, char from, std::string_view to) {
    for (std::size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size()))
        s.replace(pos, 1, to);
}

std::optional<double> parse_scaled_number(std::string_view text) {
    std::string v(trim(text));
    if (v.empty()) return std::nullopt;
    replace_all(v, 'k', "e3");
    replace_all(v, 'm', "e-3");
    replace_all(v, 'u', "e-6");
    if (v.find("PM") == std::string::npos && v.find("AM") == std::string::npos)
        replace_all(v, 'M', "e6");

    const char* begin = v.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') return std::nullopt;
    return value;
}

std::map<std::string, std::string> parse_key_value_lines(std::string_view text) {
    std::map<std::string, std::string> out;
    while (!text.empty()) {
        const std::size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

        const std::size_t eq = line.find('=');
        if (eq == std::string_view::npos) continue;
        std::string_view key = trim(line.substr(0, eq));
        if (key.empty()) continue;
        out[std::string(key)] = std::string(trim(line.substr(eq + 1)));
    }
    return out;
}

static uint64_t read_decimal(std::istream& in, std::size_t digits, std::string_view format, const char* field) {
    std::string buf(digits, '\0');
    in.read(buf.data(), static_cast<std::streamsize>(digits));
    if (static_cast<std::size_t>(in.gcount()) != digits) throw_io(format, "header prefix truncated", field);
    uint64_t value = 0;
    for (char c : buf) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            throw_malformed(format, "header prefix '" + buf + "' is not a decimal number", field);
        if (!append_decimal_digit(value, c))
            throw_malformed(format, "header prefix '" + buf + "' overflows", field);
    }
    return value;
}

PrefixedBlock read_prefixed_block(std::istream& in, std::string_view format) {
    PrefixedBlock out;
    const auto width = static_cast<std::size_t>(read_decimal(in, 1, format, "header_size_width"));
    if (width == 0) throw_malformed(format, "header length has zero digits", "header_size_width");
    const uint64_t length = read_decimal(in, width, format, "header_size");

    const auto available = remaining_bytes(in);
    if (available && length > *available)
        throw_io(format, "header declares " + std::to_string(length) + " bytes, file holds " +
                             std::to_string(*available), "header");

    out.block.resize(static_cast<std::size_t>(length));
    in.read(out.block.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(in.gcount()) != length)
        throw_io(format, "header declares " + std::to_string(length) + " bytes, file ends early", "header");
    out.header_size = 1 + width + static_cast<std::size_t>(length);
    return out;
}

} // namespace iqdec::utils
