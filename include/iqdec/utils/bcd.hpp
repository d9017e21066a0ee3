#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <ratio>
#include <span>
#include <string>

namespace iqdec::utils {

// 100 ns resolution, the finest digit the time register carries.
using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

// Time-of-capture register of a TCAP acquisition. Layout of the 12 byte
// register (bytes 0..2 are not defined):
//
//   byte 3  | status        | days hundreds |
//   byte 4  | days tens     | days units    |
//   byte 5  | hours tens    | hours units   |
//   byte 6  | minutes tens  | minutes units |
//   byte 7  | seconds tens  | seconds units |
//   byte 8  | 1E-1 s        | 1E-2 s        |
//   byte 9  | 1E-3 s        | 1E-4 s        |
//   byte 10 | 1E-5 s        | 1E-6 s        |
//   byte 11 | 1E-7 s        | not defined   |
struct BcdTimestamp {
    uint32_t days{0};
    uint32_t hours{0};
    uint32_t minutes{0};
    uint32_t seconds{0};
    uint32_t sub_second_ticks{0}; // 0..9999999, units of 1E-7 s
    uint8_t status{0};

    Ticks elapsed() const;
    double seconds_with_fraction() const;
    std::chrono::sys_time<Ticks> to_time_point() const;
    // "YYYY-MM-DD HH:MM:SS.fffffff" in UTC
    std::string to_string() const;
};

inline constexpr std::size_t BCD_REGISTER_SIZE = 12;

// Returns the decimal digit held by a nibble, or nullopt for 0xA..0xF.
inline std::optional<uint8_t> bcd_digit(uint8_t nibble) {
    nibble &= 0x0F;
    if (nibble > 9) return std::nullopt;
    return nibble;
}

// Decode the register; throws DecodeError(MalformedMetadata) naming the
// offending digit when a nibble is not a decimal digit or a field is out of
// its calendar range.
BcdTimestamp decode_bcd_timestamp(std::span<const uint8_t> reg);

} // namespace iqdec::utils
