#pragma once

/**
 * Partition of the periodic box into m^3 cubic subcells.
 *
 * m is the smallest count per row whose subcell edge does not exceed the skin
 * radius, so a cutoff sphere (cutoff <= skin) around any particle lies inside
 * its own subcell plus the 26 surrounding ones. Grids with m < 3 would make
 * stencil cells coincide and are rejected, and so are grids above
 * kMaxSubcellsPerRow, whose cell count would not fit a CellId-indexed arena.
 *
 * Subcell (cx, cy, cz) is linearised as cx + cy*m + cz*m^2.
 */

#include "nbp/types.hpp"

#include <array>
#include <cstddef>

namespace nbp {

class SubcellGrid {
public:
    static constexpr int kMinSubcellsPerRow = 3;
    static constexpr int kMaxSubcellsPerRow = 256;

    // Throws ConfigurationError on invalid radii, when m < 3 or when
    // m > kMaxSubcellsPerRow
    static SubcellGrid compute(double box_length, double skin_radius);

    int subcells_per_row() const noexcept { return m_; }
    double subcell_length() const noexcept { return subcell_length_; }
    double box_length() const noexcept { return box_length_; }
    size_t num_cells() const noexcept {
        const auto m = static_cast<size_t>(m_);
        return m * m * m;
    }

    // Per-axis subcell coordinates of an already wrapped position.
    // Throws BoundsError for non-finite or out-of-range coordinates.
    std::array<int, 3> cell_coords(const Vec3& wrapped_position) const;

    CellId linear_id(int cx, int cy, int cz) const noexcept {
        return cx + cy * m_ + cz * m_ * m_;
    }

    CellId cell_id(const Vec3& wrapped_position) const;

    // Periodic wrap of a subcell coordinate one step outside [0, m)
    int wrap_coord(int c) const noexcept {
        if (c < 0) return m_ - 1;
        if (c >= m_) return 0;
        return c;
    }

private:
    SubcellGrid(double box_length, int m);

    double box_length_;
    int m_;
    double subcell_length_;
};

} // namespace nbp
