#include "nbp/update_scheduler.hpp"
#include "nbp/error.hpp"
#include "nbp/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace nbp {

UpdateScheduler::UpdateScheduler(double skin_radius, double cutoff_radius)
    : skin_radius_(skin_radius)
    , cutoff_radius_(cutoff_radius) {
    NBP_CHECK_CONFIG(std::isfinite(cutoff_radius) && cutoff_radius > 0.0,
                     "cutoff radius must be finite and positive", "");
    NBP_CHECK_CONFIG(std::isfinite(skin_radius) && skin_radius > cutoff_radius,
                     "skin radius " + std::to_string(skin_radius) +
                     " must be larger than the cutoff radius " + std::to_string(cutoff_radius),
                     "a zero skin margin would require a rebuild on every step");
}

double UpdateScheduler::max_displacement(const Positions& current, const Positions& last_build) const {
    NBP_CHECK_ARGUMENT(current.size() == last_build.size(),
                       "current positions hold " + std::to_string(current.size()) +
                       " particles but the last build held " + std::to_string(last_build.size()));

    double max_sq = 0.0;
    for (size_t i = 0; i < current.size(); ++i) {
        const double sq = (current[i] - last_build[i]).squaredNorm();
        if (std::isnan(sq)) return sq;
        max_sq = std::max(max_sq, sq);
    }
    return std::sqrt(max_sq);
}

bool UpdateScheduler::should_rebuild(const Positions& current, const Positions& last_build) const {
    const double moved = max_displacement(current, last_build);
    // NaN displacement compares false; force a rebuild so the index reports it
    if (!(moved <= margin())) {
        LOG_DEBUG("Max displacement ", moved, " exceeds skin margin ", margin());
        return true;
    }
    return false;
}

} // namespace nbp
