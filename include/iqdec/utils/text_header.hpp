#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace iqdec::utils {

// Numeric header value with the instrument's unit suffixes:
//   k -> e3, m -> e-3, u -> e-6, M -> e6
// The M rule is skipped when the text carries "AM" or "PM", which marks a
// time of day rather than a mega prefix. The whole string must parse.
std::optional<double> parse_scaled_number(std::string_view text);

// "key = value" lines; keys and values are trimmed, lines without '=' are
// ignored, later keys overwrite earlier ones.
std::map<std::string, std::string> parse_key_value_lines(std::string_view text);

// Leading header block framed as <d><d digits of length><length bytes>.
struct PrefixedBlock {
    std::string block;
    std::size_t header_size{0}; // offset of the first byte after the block
};

// Reads a length-prefixed block from the current position of `in`.
// Throws DecodeError (MalformedMetadata for bad digits, Io for short reads).
PrefixedBlock read_prefixed_block(std::istream& in, std::string_view format);

std::string_view trim(std::string_view s);

// Count carried as a floating header value. nullopt unless the value is a
// non-negative integer below 2^64.
std::optional<uint64_t> to_count(double v);

// value = value * 10 + digit; false when the result would not fit.
bool append_decimal_digit(uint64_t& value, char digit);

// Bytes from the current read position to the end of `in`; nullopt when the
// stream cannot seek. The read position is left unchanged.
std::optional<uint64_t> remaining_bytes(std::istream& in);

} // namespace iqdec::utils
