#pragma once

#include "nbp/types.hpp"

#include <cstddef>

namespace nbp {

/**
 * Read-only view of the current particle positions owned by the simulation.
 */
class PositionProvider {
public:
    virtual ~PositionProvider() = default;
    virtual const Positions& positions() const = 0;
};

/**
 * Minimal simulation state: owns one position per particle and lets a driver
 * (optimizer, benchmark, test) move them between neighbor-list steps.
 */
class ParticleSystem : public PositionProvider {
public:
    ParticleSystem() = default;
    explicit ParticleSystem(Positions positions);

    const Positions& positions() const override { return positions_; }
    size_t size() const noexcept { return positions_.size(); }

    const Vec3& position(ParticleId i) const;
    void set_position(ParticleId i, const Vec3& position);
    void displace(ParticleId i, const Vec3& delta);

    // Replaces every position; the particle count may change
    void reset(Positions positions);

private:
    Positions positions_;
};

} // namespace nbp
