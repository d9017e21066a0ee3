#include "iqdec/window.hpp"
#include "iqdec/error.hpp"
#include "iqdec/log.hpp"

#include <limits>
#include <string>

namespace iqdec {

static bool mul_overflows(uint64_t a, uint64_t b) {
    return a != 0 && b > std::numeric_limits<uint64_t>::max() / a;
}

WindowPlan compute_window(const WindowRequest& req, const UnitGeometry& geom, std::string_view format) {
    if (req.frame_length == 0) throw_out_of_range(format, "frame length must be positive", "frame_length");
    if (req.frame_count == 0) throw_out_of_range(format, "frame count must be positive", "frame_count");
    if (req.start_frame == 0) throw_out_of_range(format, "start frame is 1-based", "start_frame");
    if (geom.samples_per_unit == 0) throw_out_of_range(format, "unit holds no samples", "samples_per_unit");

    if (mul_overflows(req.frame_count, req.frame_length) || mul_overflows(req.start_frame - 1, req.frame_length))
        throw_out_of_range(format, "window arithmetic overflows", "frame_length");

    WindowPlan plan;
    plan.total_samples = req.frame_count * req.frame_length;
    plan.start_sample = (req.start_frame - 1) * req.frame_length;
    plan.start_unit = plan.start_sample / geom.samples_per_unit;
    plan.intra_unit_offset = plan.start_sample % geom.samples_per_unit;

    const uint64_t span = plan.intra_unit_offset + plan.total_samples;
    if (span < plan.total_samples) throw_out_of_range(format, "window arithmetic overflows", "frame_count");
    plan.units_needed = span / geom.samples_per_unit + (span % geom.samples_per_unit ? 1 : 0);

    if (plan.start_unit > geom.units_per_file || plan.units_needed > geom.units_per_file - plan.start_unit) {
        throw_out_of_range(format,
                           "window needs units [" + std::to_string(plan.start_unit) + ", " +
                               std::to_string(plan.start_unit + plan.units_needed) + ") of " +
                               std::to_string(geom.units_per_file),
                           "start_frame");
    }

    IQDEC_LOGF("%.*s: window start_unit=%llu intra=%llu units=%llu", static_cast<int>(format.size()), format.data(),
               static_cast<unsigned long long>(plan.start_unit),
               static_cast<unsigned long long>(plan.intra_unit_offset),
               static_cast<unsigned long long>(plan.units_needed));
    return plan;
}

} // namespace iqdec
