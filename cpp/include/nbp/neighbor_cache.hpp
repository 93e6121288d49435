#pragma once

/**
 * Symmetric neighbor adjacency for every particle, assembled from the
 * half-lists of a NeighborSearch.
 *
 * For each pair (i, j) found from i the same distance value is appended to
 * both i's and j's entry, so the two sides always agree bit for bit.
 */

#include "nbp/neighbor_search.hpp"
#include "nbp/types.hpp"

#include <vector>

namespace nbp {

class ThreadPool;

class NeighborCache {
public:
    NeighborCache() = default;

    // Serial assembly over particle ids 0..N-1 in increasing order
    void rebuild(const NeighborSearch& search, size_t num_particles);

    // Half-lists computed on the pool, symmetrised serially in id order;
    // produces the same adjacency as the serial rebuild
    void rebuild(const NeighborSearch& search, size_t num_particles, ThreadPool& pool);

    // Throws QueryError for ids the cache has not indexed
    const NeighborResult& query(ParticleId particle_id) const;

    bool built() const noexcept { return built_; }
    size_t size() const noexcept { return adjacency_.size(); }
    size_t pair_count() const noexcept { return pair_count_; }

    const std::vector<NeighborResult>& frame() const noexcept { return adjacency_; }

private:
    void symmetrize(const std::vector<std::vector<NeighborPair>>& half_lists);
    void append_pairs(ParticleId i, const std::vector<NeighborPair>& half);

    std::vector<NeighborResult> adjacency_;
    size_t pair_count_ = 0;
    bool built_ = false;
};

} // namespace nbp
