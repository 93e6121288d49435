#include "nbp/neighbor_cache.hpp"
#include "nbp/error.hpp"
#include "nbp/logging.hpp"
#include "nbp/thread_pool.hpp"

#include <string>

namespace nbp {

void NeighborCache::rebuild(const NeighborSearch& search, size_t num_particles) {
    NBP_CHECK_ARGUMENT(num_particles == search.num_particles(),
                       "particle count does not match the linked-cell index");

    adjacency_.assign(num_particles, NeighborResult{});
    pair_count_ = 0;
    built_ = false;

    for (size_t i = 0; i < num_particles; ++i) {
        append_pairs(static_cast<ParticleId>(i), search.pairs(static_cast<ParticleId>(i)));
    }

    built_ = true;
    LOG_DEBUG("Neighbor cache rebuilt: ", num_particles, " particles, ", pair_count_, " pairs");
}

void NeighborCache::rebuild(const NeighborSearch& search, size_t num_particles, ThreadPool& pool) {
    NBP_CHECK_ARGUMENT(num_particles == search.num_particles(),
                       "particle count does not match the linked-cell index");

    // Each task writes only its own slot
    std::vector<std::vector<NeighborPair>> half_lists(num_particles);
    pool.parallel_for(0, num_particles, [&search, &half_lists](size_t i) {
        half_lists[i] = search.pairs(static_cast<ParticleId>(i));
    });

    symmetrize(half_lists);
    LOG_DEBUG("Neighbor cache rebuilt on ", pool.num_threads(), " threads: ",
              num_particles, " particles, ", pair_count_, " pairs");
}

void NeighborCache::symmetrize(const std::vector<std::vector<NeighborPair>>& half_lists) {
    adjacency_.assign(half_lists.size(), NeighborResult{});
    pair_count_ = 0;
    built_ = false;

    for (size_t i = 0; i < half_lists.size(); ++i) {
        append_pairs(static_cast<ParticleId>(i), half_lists[i]);
    }

    built_ = true;
}

void NeighborCache::append_pairs(ParticleId i, const std::vector<NeighborPair>& half) {
    auto& own = adjacency_[static_cast<size_t>(i)];
    for (const auto& p : half) {
        auto& other = adjacency_[static_cast<size_t>(p.id)];
        own.ids.push_back(p.id);
        own.distances.push_back(p.distance);
        other.ids.push_back(i);
        other.distances.push_back(p.distance);
        ++pair_count_;
    }
}

const NeighborResult& NeighborCache::query(ParticleId particle_id) const {
    if (!built_) {
        throw QueryError("neighbor query for particle " + std::to_string(particle_id) +
                         " before the cache was built", __func__,
                         "build the neighbor list before querying it");
    }
    if (particle_id < 0 || static_cast<size_t>(particle_id) >= adjacency_.size()) {
        throw QueryError("particle " + std::to_string(particle_id) + " is not in the neighbor cache (N = " +
                         std::to_string(adjacency_.size()) + ")", __func__);
    }
    return adjacency_[static_cast<size_t>(particle_id)];
}

} // namespace nbp
