#include "nbp/neighbor_config.hpp"
#include "nbp/error.hpp"

#include <cmath>
#include <string>

namespace nbp {

void NeighborConfig::validate() const {
    NBP_CHECK_CONFIG(std::isfinite(box_length) && box_length > 0.0,
                     "box length must be finite and positive", "");
    NBP_CHECK_CONFIG(std::isfinite(cutoff_radius) && cutoff_radius > 0.0,
                     "cutoff radius must be finite and positive", "");
    NBP_CHECK_CONFIG(std::isfinite(skin_radius) && skin_radius > cutoff_radius,
                     "skin radius " + std::to_string(skin_radius) +
                     " must be larger than the cutoff radius " + std::to_string(cutoff_radius),
                     "");
    NBP_CHECK_CONFIG(cutoff_radius <= box_length / 2.0,
                     "cutoff radius " + std::to_string(cutoff_radius) +
                     " exceeds half the box length " + std::to_string(box_length),
                     "");
    NBP_CHECK_CONFIG(num_threads >= 1, "at least one rebuild thread is required", "");
}

NeighborConfig NeighborConfig::from_system(const SystemInfo& info, const Config& config) {
    NeighborConfig out;
    out.box_length = info.box_length();
    out.cutoff_radius = info.cutoff_radius();
    out.skin_radius = info.skin_radius();

    const int threads = config.get<int>("neighbors.threads", 1);
    NBP_CHECK_CONFIG(threads >= 1, "neighbors.threads must be at least 1, got " + std::to_string(threads), "");
    out.num_threads = static_cast<size_t>(threads);
    return out;
}

SystemInfo make_system_info(double characteristic_length,
                            const std::vector<double>& sigmas,
                            const Config& config) {
    return SystemInfo(characteristic_length, sigmas,
                      config.get<double>("neighbors.cutoff_factor", SystemInfoDefaults::cutoff_factor),
                      config.get<double>("neighbors.skin_factor", SystemInfoDefaults::skin_factor));
}

} // namespace nbp
