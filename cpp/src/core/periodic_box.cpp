/**
 * Periodic box helpers: position wrapping and minimum-image separations.
 */

#include "nbp/periodic_box.hpp"
#include "nbp/error.hpp"

#include <cmath>
#include <string>

namespace nbp {

PeriodicBox::PeriodicBox(double length) : length_(length) {
    NBP_CHECK_CONFIG(std::isfinite(length) && length > 0.0,
                     "box length must be finite and positive, got " + std::to_string(length),
                     "pass the characteristic length of the simulation box");
}

double PeriodicBox::wrap(double x) const noexcept {
    double w = x - std::floor(x / length_) * length_;
    // Tiny negative inputs round to exactly L
    if (w >= length_) w -= length_;
    if (w < 0.0) w = 0.0;
    return w;
}

Vec3 PeriodicBox::wrap(const Vec3& position) const noexcept {
    return Vec3(wrap(position.x()), wrap(position.y()), wrap(position.z()));
}

Positions PeriodicBox::wrap_all(const Positions& positions) const {
    Positions out;
    out.reserve(positions.size());
    for (const auto& p : positions) {
        out.push_back(wrap(p));
    }
    return out;
}

Vec3 PeriodicBox::minimum_image(const Vec3& delta) const noexcept {
    Vec3 out;
    for (int axis = 0; axis < 3; ++axis) {
        out[axis] = delta[axis] - std::round(delta[axis] / length_) * length_;
    }
    return out;
}

double PeriodicBox::minimum_image_distance(const Vec3& a, const Vec3& b) const noexcept {
    return minimum_image(a - b).norm();
}

bool PeriodicBox::contains(const Vec3& position) const noexcept {
    for (int axis = 0; axis < 3; ++axis) {
        if (!(position[axis] >= 0.0 && position[axis] < length_)) return false;
    }
    return true;
}

} // namespace nbp
