#include "nbp/neighbor_search.hpp"
#include "nbp/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace nbp {

NeighborSearch::NeighborSearch(const SubcellGrid& grid, const LinkedCellIndex& index, double cutoff_radius)
    : grid_(grid)
    , index_(index)
    , cutoff_radius_(cutoff_radius)
    // 2*edge is the reach of the stencil; for m == 3 it passes L/2 and would
    // keep the long image of a pair, so clamp to the true minimum-image bound
    , threshold_(std::min(2.0 * grid.subcell_length(), 0.5 * grid.box_length())) {
    NBP_CHECK_CONFIG(std::isfinite(cutoff_radius) && cutoff_radius > 0.0,
                     "cutoff radius must be finite and positive", "");
    NBP_CHECK_ARGUMENT(static_cast<size_t>(index.num_cells()) == grid.num_cells(),
                       "linked-cell index was built for a different subcell grid");
}

std::array<CellId, kStencilSize> NeighborSearch::stencil(const Vec3& wrapped_position) const {
    const auto c = grid_.cell_coords(wrapped_position);

    std::array<CellId, kStencilSize> cells{};
    int n = 0;
    for (int dx = -1; dx <= 1; ++dx) {
        const int x = grid_.wrap_coord(c[0] + dx);
        for (int dy = -1; dy <= 1; ++dy) {
            const int y = grid_.wrap_coord(c[1] + dy);
            for (int dz = -1; dz <= 1; ++dz) {
                const int z = grid_.wrap_coord(c[2] + dz);
                cells[n++] = grid_.linear_id(x, y, z);
            }
        }
    }
    return cells;
}

std::vector<ParticleId> NeighborSearch::candidates(ParticleId particle_id) const {
    NBP_CHECK_ARGUMENT(particle_id >= 0 && static_cast<size_t>(particle_id) < index_.size(),
                       "particle id " + std::to_string(particle_id) + " is not indexed");

    std::vector<ParticleId> out;
    for (CellId cell : stencil(index_.position(particle_id))) {
        index_.for_each_in_cell(cell, [&out](ParticleId j) { out.push_back(j); });
    }
    return out;
}

double NeighborSearch::distance(const Vec3& a, const Vec3& b) const noexcept {
    const double box_length = grid_.box_length();
    Vec3 d = (a - b).cwiseAbs();
    for (int axis = 0; axis < 3; ++axis) {
        if (d[axis] > threshold_) {
            d[axis] = box_length - d[axis];
        }
    }
    return d.norm();
}

std::vector<NeighborPair> NeighborSearch::pairs(ParticleId particle_id) const {
    const auto found = candidates(particle_id);
    const Vec3& pos = index_.position(particle_id);

    std::vector<NeighborPair> out;
    for (ParticleId j : found) {
        if (j <= particle_id) continue;
        const double d = distance(pos, index_.position(j));
        if (d > 0.0 && d <= cutoff_radius_) {
            out.push_back(NeighborPair{j, d});
        }
    }
    return out;
}

} // namespace nbp
