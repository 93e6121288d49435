#pragma once

/**
 * Static description of a simulated system as seen by the neighbor search.
 *
 * The cutoff radius is a multiple of the largest interaction range (sigma)
 * across particle types, and the box length is the requested characteristic
 * length rounded up to a whole number of cutoff radii. The skin radius uses
 * the same sigma basis with a larger factor so the skin margin stays positive.
 */

#include "nbp/periodic_box.hpp"

#include <vector>

namespace nbp {

struct SystemInfoDefaults {
    static constexpr double cutoff_factor = 3.0;
    static constexpr double skin_factor = 4.0;
};

class SystemInfo {
public:
    SystemInfo(double characteristic_length,
               const std::vector<double>& sigmas,
               double cutoff_factor = SystemInfoDefaults::cutoff_factor,
               double skin_factor = SystemInfoDefaults::skin_factor);

    double box_length() const noexcept { return box_length_; }
    double volume() const noexcept { return box_length_ * box_length_ * box_length_; }
    double cutoff_radius() const noexcept { return cutoff_radius_; }
    double skin_radius() const noexcept { return skin_radius_; }
    double sigma_max() const noexcept { return sigma_max_; }

    PeriodicBox box() const { return PeriodicBox(box_length_); }

private:
    double sigma_max_ = 0.0;
    double cutoff_radius_ = 0.0;
    double skin_radius_ = 0.0;
    double box_length_ = 0.0;
};

} // namespace nbp
