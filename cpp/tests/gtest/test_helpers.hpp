#pragma once

#include "nbp/periodic_box.hpp"
#include "nbp/types.hpp"

#include <random>
#include <set>
#include <utility>

namespace nbp::test {

inline Positions random_positions(size_t n, double length, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> coord(0.0, length);
    Positions out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.emplace_back(coord(rng), coord(rng), coord(rng));
    }
    return out;
}

// All unordered pairs (i < j) within cutoff by exhaustive minimum-image search
inline std::set<std::pair<ParticleId, ParticleId>> brute_force_pairs(const Positions& positions,
                                                                     const PeriodicBox& box,
                                                                     double cutoff) {
    std::set<std::pair<ParticleId, ParticleId>> out;
    for (size_t i = 0; i < positions.size(); ++i) {
        for (size_t j = i + 1; j < positions.size(); ++j) {
            const double d = box.minimum_image_distance(box.wrap(positions[i]), box.wrap(positions[j]));
            if (d > 0.0 && d <= cutoff) {
                out.emplace(static_cast<ParticleId>(i), static_cast<ParticleId>(j));
            }
        }
    }
    return out;
}

} // namespace nbp::test
