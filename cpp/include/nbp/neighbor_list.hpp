#pragma once

/**
 * Neighbor list for a periodic cubic box of point particles.
 *
 * This is the interface used by energy/force evaluators and the optimizer:
 *
 *   NeighborList nl(system, config);   // validates config, builds once
 *   nl.get_neighbors(i);               // cached (ids, distances) of particle i
 *   nl.step();                         // once per simulation step
 *
 * Index and cache are held together in an immutable NeighborSnapshot. A
 * rebuild assembles a complete new snapshot and publishes it with one atomic
 * pointer store, so concurrent readers see either the old or the new
 * snapshot, never a mix. step() itself must be driven from a single thread.
 */

#include "nbp/linked_cell_index.hpp"
#include "nbp/neighbor_cache.hpp"
#include "nbp/neighbor_config.hpp"
#include "nbp/particle_system.hpp"
#include "nbp/periodic_box.hpp"
#include "nbp/subcell_grid.hpp"
#include "nbp/types.hpp"
#include "nbp/update_scheduler.hpp"

#include <memory>

namespace nbp {

class ThreadPool;

struct NeighborSnapshot {
    LinkedCellIndex index;
    NeighborCache cache;
    Positions reference;        // unwrapped positions the snapshot was built from
    size_t built_at_step = 0;
};

class NeighborList {
public:
    // Throws ConfigurationError for an invalid config and BoundsError when the
    // initial positions cannot be indexed
    NeighborList(const PositionProvider& provider, const NeighborConfig& config);
    // The provider is held by reference and must outlive the list
    NeighborList(PositionProvider&& provider, const NeighborConfig& config) = delete;
    ~NeighborList();

    NeighborList(const NeighborList&) = delete;
    NeighborList& operator=(const NeighborList&) = delete;

    // Copy of the cached neighbours; throws QueryError for unknown ids
    NeighborResult get_neighbors(ParticleId particle_id) const;

    std::shared_ptr<const NeighborSnapshot> snapshot() const;

    // Advances one step; returns true when the lists were rebuilt
    bool step();

    // Unconditional rebuild from the provider's current positions
    void rebuild();

    size_t step_count() const noexcept { return step_count_; }
    size_t steps_since_rebuild() const noexcept { return steps_since_rebuild_; }
    // Snapshots published so far, the construction-time build included
    size_t rebuild_count() const noexcept { return rebuild_count_; }
    size_t last_rebuild_step() const noexcept { return last_rebuild_step_; }

    const PeriodicBox& box() const noexcept { return box_; }
    const SubcellGrid& grid() const noexcept { return grid_; }
    double cutoff_radius() const noexcept { return config_.cutoff_radius; }
    double skin_radius() const noexcept { return config_.skin_radius; }
    size_t num_particles() const;

private:
    std::shared_ptr<const NeighborSnapshot> build_snapshot(const Positions& positions) const;
    void publish(std::shared_ptr<const NeighborSnapshot> next);

    const PositionProvider& provider_;
    NeighborConfig config_;
    PeriodicBox box_;
    SubcellGrid grid_;
    UpdateScheduler scheduler_;
    std::unique_ptr<ThreadPool> pool_;
    std::shared_ptr<const NeighborSnapshot> snapshot_;

    size_t step_count_ = 0;
    size_t steps_since_rebuild_ = 0;
    size_t rebuild_count_ = 0;
    size_t last_rebuild_step_ = 0;
};

} // namespace nbp
