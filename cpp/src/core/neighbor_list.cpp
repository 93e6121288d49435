#include "nbp/neighbor_list.hpp"
#include "nbp/error.hpp"
#include "nbp/logging.hpp"
#include "nbp/neighbor_search.hpp"
#include "nbp/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <utility>

namespace nbp {

namespace {

const NeighborConfig& validated(const NeighborConfig& config) {
    try {
        config.validate();
    } catch (const ConfigurationError& e) {
        LOG_ERROR("Rejected neighbor list configuration: ", e.what());
        throw;
    }
    return config;
}

} // namespace

NeighborList::NeighborList(const PositionProvider& provider, const NeighborConfig& config)
    : provider_(provider)
    , config_(validated(config))
    , box_(config.box_length)
    , grid_(SubcellGrid::compute(config.box_length, config.skin_radius))
    , scheduler_(config.skin_radius, config.cutoff_radius) {
    if (config_.num_threads > 1) {
        pool_ = std::make_unique<ThreadPool>(config_.num_threads);
    }

    LOG_INFO("Neighbor list: L=", box_.length(), " cutoff=", config_.cutoff_radius,
             " skin=", config_.skin_radius, " subcells/row=", grid_.subcells_per_row(),
             " threads=", config_.num_threads);

    publish(build_snapshot(provider_.positions()));
}

NeighborList::~NeighborList() = default;

std::shared_ptr<const NeighborSnapshot> NeighborList::build_snapshot(const Positions& positions) const {
    auto start = std::chrono::steady_clock::now();

    auto next = std::make_shared<NeighborSnapshot>();
    next->index = LinkedCellIndex::build(grid_, box_, positions);
    next->reference = positions;
    next->built_at_step = step_count_;

    NeighborSearch search(grid_, next->index, config_.cutoff_radius);
    if (pool_) {
        next->cache.rebuild(search, positions.size(), *pool_);
    } else {
        next->cache.rebuild(search, positions.size());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_DEBUG("Built neighbor snapshot at step ", step_count_, ": ", positions.size(),
              " particles, ", next->cache.pair_count(), " pairs in ", elapsed.count(), " us");
    return next;
}

void NeighborList::publish(std::shared_ptr<const NeighborSnapshot> next) {
    std::atomic_store(&snapshot_, std::move(next));
    steps_since_rebuild_ = 0;
    last_rebuild_step_ = step_count_;
    ++rebuild_count_;
}

std::shared_ptr<const NeighborSnapshot> NeighborList::snapshot() const {
    return std::atomic_load(&snapshot_);
}

NeighborResult NeighborList::get_neighbors(ParticleId particle_id) const {
    auto current = snapshot();
    if (!current) {
        throw QueryError("neighbor list has not been built", __func__);
    }
    return current->cache.query(particle_id);
}

size_t NeighborList::num_particles() const {
    auto current = snapshot();
    return current ? current->cache.size() : 0;
}

void NeighborList::rebuild() {
    publish(build_snapshot(provider_.positions()));
}

bool NeighborList::step() {
    ++step_count_;

    const Positions& current = provider_.positions();
    auto last = snapshot();

    bool rebuild_needed;
    if (current.size() != last->reference.size()) {
        LOG_INFO("Particle count changed from ", last->reference.size(), " to ",
                 current.size(), ", rebuilding neighbor list");
        rebuild_needed = true;
    } else {
        rebuild_needed = scheduler_.should_rebuild(current, last->reference);
    }

    if (!rebuild_needed) {
        ++steps_since_rebuild_;
        return false;
    }

    publish(build_snapshot(current));
    LOG_DEBUG("Neighbor list rebuilt at step ", step_count_, " (rebuild #", rebuild_count_, ")");
    return true;
}

} // namespace nbp
