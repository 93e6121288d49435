#pragma once

#include "nbp/types.hpp"

namespace nbp {

/**
 * Decides when accumulated particle drift invalidates the neighbor lists.
 *
 * Lists built with the skin radius stay valid while no particle has moved
 * further than the skin margin (skin - cutoff) since the last build.
 */
class UpdateScheduler {
public:
    // Throws ConfigurationError when skin_radius <= cutoff_radius
    UpdateScheduler(double skin_radius, double cutoff_radius);

    double skin_radius() const noexcept { return skin_radius_; }
    double cutoff_radius() const noexcept { return cutoff_radius_; }
    double margin() const noexcept { return skin_radius_ - cutoff_radius_; }

    // Largest Euclidean displacement of any particle; 0 for an empty system
    double max_displacement(const Positions& current, const Positions& last_build) const;

    bool should_rebuild(const Positions& current, const Positions& last_build) const;

private:
    double skin_radius_;
    double cutoff_radius_;
};

} // namespace nbp
