#include "iqdec/utils/bcd.hpp"
#include "iqdec/error.hpp"

#include <cstdio>
#include <string>

namespace iqdec::utils {

namespace {

constexpr const char* kFormat = "bcd";

struct NibbleSlot {
    std::size_t byte;
    unsigned shift;
    const char* name;
};

uint32_t digit_at(std::span<const uint8_t> reg, const NibbleSlot& slot) {
    auto d = bcd_digit(static_cast<uint8_t>(reg[slot.byte] >> slot.shift));
    if (!d) {
        char detail[64];
        std::snprintf(detail, sizeof(detail), "nibble 0x%X at byte %zu is not a decimal digit",
                      (reg[slot.byte] >> slot.shift) & 0x0F, slot.byte);
        throw_malformed(kFormat, detail, slot.name);
    }
    return *d;
}

} // namespace

BcdTimestamp decode_bcd_timestamp(std::span<const uint8_t> reg) {
    if (reg.size() < BCD_REGISTER_SIZE)
        throw_malformed(kFormat, "time register needs 12 bytes, got " + std::to_string(reg.size()), "time_register");

    BcdTimestamp ts;
    ts.status = static_cast<uint8_t>((reg[3] >> 4) & 0x0F);
    ts.days = digit_at(reg, {3, 0, "days_hundreds"}) * 100 +
              digit_at(reg, {4, 4, "days_tens"}) * 10 +
              digit_at(reg, {4, 0, "days_units"});
    ts.hours = digit_at(reg, {5, 4, "hours_tens"}) * 10 + digit_at(reg, {5, 0, "hours_units"});
    ts.minutes = digit_at(reg, {6, 4, "minutes_tens"}) * 10 + digit_at(reg, {6, 0, "minutes_units"});
    ts.seconds = digit_at(reg, {7, 4, "seconds_tens"}) * 10 + digit_at(reg, {7, 0, "seconds_units"});

    static constexpr NibbleSlot fraction[] = {
        {8, 4, "seconds_1e-1"}, {8, 0, "seconds_1e-2"}, {9, 4, "seconds_1e-3"}, {9, 0, "seconds_1e-4"},
        {10, 4, "seconds_1e-5"}, {10, 0, "seconds_1e-6"}, {11, 4, "seconds_1e-7"},
    };
    for (const auto& slot : fraction) ts.sub_second_ticks = ts.sub_second_ticks * 10 + digit_at(reg, slot);

    if (ts.hours > 23) throw_malformed(kFormat, "hours " + std::to_string(ts.hours) + " out of range", "hours");
    if (ts.minutes > 59) throw_malformed(kFormat, "minutes " + std::to_string(ts.minutes) + " out of range", "minutes");
    if (ts.seconds > 59) throw_malformed(kFormat, "seconds " + std::to_string(ts.seconds) + " out of range", "seconds");
    return ts;
}

Ticks BcdTimestamp::elapsed() const {
    const auto whole = std::chrono::days(days) + std::chrono::hours(hours) + std::chrono::minutes(minutes) +
                       std::chrono::seconds(seconds);
    return std::chrono::duration_cast<Ticks>(whole) + Ticks(sub_second_ticks);
}

double BcdTimestamp::seconds_with_fraction() const {
    return static_cast<double>(seconds) + static_cast<double>(sub_second_ticks) * 1e-7;
}

std::chrono::sys_time<Ticks> BcdTimestamp::to_time_point() const {
    return std::chrono::sys_time<Ticks>(elapsed());
}

std::string BcdTimestamp::to_string() const {
    using namespace std::chrono;
    const auto tp = to_time_point();
    const auto day = floor<std::chrono::days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss<Ticks> hms{tp - day};
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d.%07lld", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()), static_cast<long long>(hms.subseconds().count()));
    return buf;
}

} // namespace iqdec::utils
