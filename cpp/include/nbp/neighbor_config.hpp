#pragma once

#include "nbp/config.hpp"
#include "nbp/system_info.hpp"

#include <vector>

namespace nbp {

/**
 * Geometry and execution parameters of a neighbor list.
 */
struct NeighborConfig {
    double box_length = 0.0;
    double cutoff_radius = 0.0;
    double skin_radius = 0.0;
    size_t num_threads = 1;             // > 1 spreads rebuilds over a thread pool

    // Throws ConfigurationError for non-positive lengths, skin <= cutoff,
    // cutoff > L/2 or a zero thread count
    void validate() const;

    // Radii and box from the system, thread count from "neighbors.threads"
    static NeighborConfig from_system(const SystemInfo& info, const Config& config);
};

// SystemInfo whose cutoff and skin factors come from "neighbors.cutoff_factor"
// and "neighbors.skin_factor"
SystemInfo make_system_info(double characteristic_length,
                            const std::vector<double>& sigmas,
                            const Config& config);

} // namespace nbp
