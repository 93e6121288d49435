#include "nbp/subcell_grid.hpp"
#include "nbp/error.hpp"
#include "nbp/logging.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace nbp {

SubcellGrid::SubcellGrid(double box_length, int m)
    : box_length_(box_length)
    , m_(m)
    , subcell_length_(box_length / m) {}

SubcellGrid SubcellGrid::compute(double box_length, double skin_radius) {
    NBP_CHECK_CONFIG(std::isfinite(box_length) && box_length > 0.0,
                     "box length must be finite and positive", "");
    NBP_CHECK_CONFIG(std::isfinite(skin_radius) && skin_radius > 0.0,
                     "skin radius must be finite and positive", "");
    NBP_CHECK_CONFIG(skin_radius < box_length,
                     "skin radius " + std::to_string(skin_radius) +
                     " is not smaller than the box length " + std::to_string(box_length),
                     "use a larger box or a smaller skin radius");

    // Bound the row count before the search so huge boxes cannot overflow m^3
    const double rows = box_length / skin_radius;
    if (rows > static_cast<double>(kMaxSubcellsPerRow)) {
        std::ostringstream msg;
        msg << "box length " << box_length << " with skin radius " << skin_radius
            << " needs " << std::ceil(rows) << " subcells per row, at most "
            << kMaxSubcellsPerRow << " are supported";
        LOG_ERROR(msg.str());
        throw ConfigurationError(msg.str(), __func__,
                                 "use a smaller box or a larger skin radius");
    }

    int m = 1;
    while (box_length / m > skin_radius) {
        ++m;
    }

    if (m < kMinSubcellsPerRow) {
        std::ostringstream msg;
        msg << "box length " << box_length << " with skin radius " << skin_radius
            << " yields " << m << " subcells per row, at least " << kMinSubcellsPerRow
            << " are required";
        LOG_ERROR(msg.str());
        throw ConfigurationError(msg.str(), __func__,
                                 "the box must be at least three skin radii long");
    }

    SubcellGrid grid(box_length, m);
    LOG_DEBUG("Subcell grid: ", m, " per row, edge ", grid.subcell_length_,
              ", ", grid.num_cells(), " cells");
    return grid;
}

std::array<int, 3> SubcellGrid::cell_coords(const Vec3& wrapped_position) const {
    std::array<int, 3> coords{};
    for (int axis = 0; axis < 3; ++axis) {
        const double x = wrapped_position[axis];
        double c = std::floor(x / subcell_length_);
        // x just below L can divide out to exactly m
        if (c == static_cast<double>(m_) && x < box_length_) {
            c = static_cast<double>(m_ - 1);
        }
        if (!std::isfinite(c) || c < 0.0 || c >= static_cast<double>(m_)) {
            std::ostringstream msg;
            msg << "coordinate " << x << " on axis " << axis
                << " maps to subcell " << c << ", outside [0, " << m_ << ")";
            throw BoundsError(msg.str(), __func__,
                              "positions must be finite and wrapped into [0, L)");
        }
        coords[axis] = static_cast<int>(c);
    }
    return coords;
}

CellId SubcellGrid::cell_id(const Vec3& wrapped_position) const {
    const auto c = cell_coords(wrapped_position);
    return linear_id(c[0], c[1], c[2]);
}

} // namespace nbp
