#pragma once

/**
 * Cutoff-radius neighbor search over a linked-cell index.
 *
 * For a particle the search walks the 27 subcells of the 3x3x3 stencil around
 * its own subcell (with periodic wraparound of subcell coordinates) and keeps
 * the candidates whose minimum-image distance lies in (0, cutoff].
 *
 * pairs() follows the half-list convention: only candidates with a larger id
 * are reported, so every unordered pair is produced exactly once.
 *
 * The search borrows the grid and index; both must outlive it.
 */

#include "nbp/linked_cell_index.hpp"
#include "nbp/subcell_grid.hpp"
#include "nbp/types.hpp"

#include <array>
#include <vector>

namespace nbp {

class NeighborSearch {
public:
    NeighborSearch(const SubcellGrid& grid, const LinkedCellIndex& index, double cutoff_radius);

    // Own subcell plus its 26 neighbours; x offset outermost, then y, then z
    std::array<CellId, kStencilSize> stencil(const Vec3& wrapped_position) const;

    // Every particle in the stencil of particle_id, including itself
    std::vector<ParticleId> candidates(ParticleId particle_id) const;

    // Periodic distance with the per-axis correction threshold of the grid
    double distance(const Vec3& a, const Vec3& b) const noexcept;

    // Neighbours j > particle_id with 0 < d <= cutoff
    std::vector<NeighborPair> pairs(ParticleId particle_id) const;

    double cutoff_radius() const noexcept { return cutoff_radius_; }
    double periodic_threshold() const noexcept { return threshold_; }
    size_t num_particles() const noexcept { return index_.size(); }

private:
    const SubcellGrid& grid_;
    const LinkedCellIndex& index_;
    double cutoff_radius_;
    double threshold_;
};

} // namespace nbp
