#pragma once

/**
 * Linked-cell index over the subcell grid.
 *
 * head_[c] holds the most recently inserted particle of subcell c and next_[i]
 * the particle inserted into the same subcell before i; both use kEmpty as the
 * terminator. Built in one O(N) pass, immutable afterwards.
 */

#include "nbp/periodic_box.hpp"
#include "nbp/subcell_grid.hpp"
#include "nbp/types.hpp"

#include <vector>

namespace nbp {

class LinkedCellIndex {
public:
    LinkedCellIndex() = default;

    // Throws BoundsError naming the first particle that cannot be placed
    static LinkedCellIndex build(const SubcellGrid& grid,
                                 const PeriodicBox& box,
                                 const Positions& positions);

    size_t size() const noexcept { return next_.size(); }
    int num_cells() const noexcept { return static_cast<int>(head_.size()); }

    ParticleId head(CellId cell) const { return head_.at(static_cast<size_t>(cell)); }
    ParticleId next(ParticleId i) const { return next_.at(static_cast<size_t>(i)); }
    CellId cell_of(ParticleId i) const { return cell_of_.at(static_cast<size_t>(i)); }

    // Wrapped position the particle was indexed with
    const Vec3& position(ParticleId i) const { return wrapped_.at(static_cast<size_t>(i)); }
    const Positions& positions() const noexcept { return wrapped_; }

    template<typename Func>
    void for_each_in_cell(CellId cell, Func&& func) const {
        for (ParticleId i = head_[static_cast<size_t>(cell)]; i != kEmpty; i = next_[static_cast<size_t>(i)]) {
            func(i);
        }
    }

    size_t cell_occupancy(CellId cell) const;

private:
    std::vector<ParticleId> head_;
    std::vector<ParticleId> next_;
    std::vector<CellId> cell_of_;
    Positions wrapped_;
};

} // namespace nbp
