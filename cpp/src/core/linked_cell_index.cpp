#include "nbp/linked_cell_index.hpp"
#include "nbp/error.hpp"
#include "nbp/logging.hpp"

#include <limits>
#include <string>

namespace nbp {

LinkedCellIndex LinkedCellIndex::build(const SubcellGrid& grid,
                                       const PeriodicBox& box,
                                       const Positions& positions) {
    NBP_CHECK_ARGUMENT(positions.size() <= static_cast<size_t>(std::numeric_limits<ParticleId>::max()),
                       "too many particles for 32-bit particle ids");

    LinkedCellIndex index;
    index.head_.assign(grid.num_cells(), kEmpty);
    index.next_.assign(positions.size(), kEmpty);
    index.cell_of_.assign(positions.size(), kEmpty);
    index.wrapped_ = box.wrap_all(positions);

    for (size_t i = 0; i < positions.size(); ++i) {
        CellId cell;
        try {
            cell = grid.cell_id(index.wrapped_[i]);
        } catch (const BoundsError& e) {
            LOG_ERROR("Particle ", i, " cannot be placed in the subcell grid: ", e.what());
            throw BoundsError("particle " + std::to_string(i) + " at (" +
                              std::to_string(positions[i].x()) + ", " +
                              std::to_string(positions[i].y()) + ", " +
                              std::to_string(positions[i].z()) + ") is outside the subcell grid",
                              e.context(), e.suggestion());
        }

        const auto id = static_cast<ParticleId>(i);
        index.cell_of_[i] = cell;
        index.next_[i] = index.head_[static_cast<size_t>(cell)];
        index.head_[static_cast<size_t>(cell)] = id;
    }

    LOG_DEBUG("Linked-cell index built: ", positions.size(), " particles in ",
              grid.num_cells(), " subcells");
    return index;
}

size_t LinkedCellIndex::cell_occupancy(CellId cell) const {
    NBP_CHECK_ARGUMENT(cell >= 0 && cell < num_cells(), "subcell id out of range");
    size_t count = 0;
    for_each_in_cell(cell, [&count](ParticleId) { ++count; });
    return count;
}

} // namespace nbp
