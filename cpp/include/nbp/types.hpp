#pragma once

#include <cstdint>
#include <vector>

#include <Eigen/Core>

namespace nbp {

// Particle positions are plain 3D double vectors
using Vec3 = Eigen::Vector3d;

// Vector3d is not a vectorizable fixed-size type, so std::allocator is fine
using Positions = std::vector<Vec3>;

// Particle ids are dense in [0, N); subcell ids are dense in [0, m^3)
using ParticleId = int32_t;
using CellId = int32_t;

// "empty" head / "end of chain" marker in the linked-cell arena
constexpr int32_t kEmpty = -1;

// Number of subcells in the 3x3x3 search stencil
constexpr int kStencilSize = 27;

/**
 * Neighbours of one particle: parallel sequences of ids and minimum-image
 * distances, in the order the cache assembled them.
 */
struct NeighborResult {
    std::vector<ParticleId> ids;
    std::vector<double> distances;

    size_t size() const noexcept { return ids.size(); }
    bool empty() const noexcept { return ids.empty(); }
};

// One half-list entry produced by the search for a given particle
struct NeighborPair {
    ParticleId id;
    double distance;
};

} // namespace nbp
