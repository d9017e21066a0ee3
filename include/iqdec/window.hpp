#pragma once
#include <cstdint>
#include <string_view>
#include "iqdec/types.hpp"

namespace iqdec {

// Storage unit of a format: a record, block or frame holding a fixed number
// of samples. Flat sample arrays use samples_per_unit == 1.
struct UnitGeometry {
    uint64_t samples_per_unit{1};
    uint64_t units_per_file{0};
};

struct WindowPlan {
    uint64_t start_sample{0};       // (S-1)*L
    uint64_t total_samples{0};      // N*L
    uint64_t start_unit{0};         // 0-based
    uint64_t intra_unit_offset{0};  // samples to drop from the first unit
    uint64_t units_needed{0};
};

// Translate a (L, N, S) request into the storage units that cover it.
// Throws DecodeError(OutOfRange) when the request is malformed or the units
// run past units_per_file. `format` names the caller in the error.
WindowPlan compute_window(const WindowRequest& req, const UnitGeometry& geom, std::string_view format = "window");

} // namespace iqdec
