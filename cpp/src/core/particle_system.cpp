#include "nbp/particle_system.hpp"
#include "nbp/error.hpp"

#include <string>
#include <utility>

namespace nbp {

namespace {

void check_id(ParticleId i, size_t n) {
    if (i < 0 || static_cast<size_t>(i) >= n) {
        throw InvalidArgumentError("particle id " + std::to_string(i) +
                                   " outside [0, " + std::to_string(n) + ")", "ParticleSystem");
    }
}

} // namespace

ParticleSystem::ParticleSystem(Positions positions) : positions_(std::move(positions)) {}

const Vec3& ParticleSystem::position(ParticleId i) const {
    check_id(i, positions_.size());
    return positions_[static_cast<size_t>(i)];
}

void ParticleSystem::set_position(ParticleId i, const Vec3& position) {
    check_id(i, positions_.size());
    positions_[static_cast<size_t>(i)] = position;
}

void ParticleSystem::displace(ParticleId i, const Vec3& delta) {
    check_id(i, positions_.size());
    positions_[static_cast<size_t>(i)] += delta;
}

void ParticleSystem::reset(Positions positions) {
    positions_ = std::move(positions);
}

} // namespace nbp
