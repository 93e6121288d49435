#pragma once

/**
 * Cubic periodic simulation box of side L.
 *
 * All coordinates are interpreted modulo L. wrap() maps any finite position
 * into [0, L)^3; minimum_image() maps a separation vector into [-L/2, L/2]^3.
 */

#include "nbp/types.hpp"

namespace nbp {

class PeriodicBox {
public:
    // Throws ConfigurationError unless length is finite and positive
    explicit PeriodicBox(double length);

    double length() const noexcept { return length_; }
    double volume() const noexcept { return length_ * length_ * length_; }

    // Single coordinate into [0, L); a result that rounds up to L folds to 0
    double wrap(double x) const noexcept;
    Vec3 wrap(const Vec3& position) const noexcept;

    // Copy of positions with every particle moved back into the box
    Positions wrap_all(const Positions& positions) const;

    // Separation vector reduced to its nearest periodic image
    Vec3 minimum_image(const Vec3& delta) const noexcept;

    // Minimum-image Euclidean distance between two positions
    double minimum_image_distance(const Vec3& a, const Vec3& b) const noexcept;

    bool contains(const Vec3& position) const noexcept;

private:
    double length_;
};

} // namespace nbp
