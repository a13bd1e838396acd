#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>

namespace pi_blocks {

// Per-body quantities: component 0 is the large block, component 1 the small block
using Vec2 = Eigen::Vector2d;

/**
 * @brief Body indices for standardization
 */
enum class BodyIndex {
    LARGE = 0,                      // Large block (user-chosen mass)
    SMALL = 1                       // Small block (reference mass)
};

inline constexpr int idx(BodyIndex body) { return static_cast<int>(body); }

/**
 * @brief Fixed design constants of a fresh configuration
 *
 * Coordinates are left edges measured from the wall at x = 0.
 */
struct InitialLayout {
    double x_large;         // Large block start position
    double x_small;         // Small block start position
    double w_large;         // Large block width
    double w_small;         // Small block width
    double m_small;         // Reference mass of the small block

    // Default constructor
    InitialLayout() : x_large(400.0), x_small(200.0), w_large(150.0), w_small(50.0), m_small(1.0) {}
};

/**
 * @brief Two-block simulation state
 *
 * Contains:
 * - x(2): Left-edge positions
 * - v(2): Signed velocities, negative means moving toward the wall
 * - m(2): Masses
 * - w(2): Widths (contact geometry only)
 * - collisions: Cumulative wall and block collisions
 * - finished: Sticky flag, set once no further collision can occur
 */
struct State {
    Vec2 x;
    Vec2 v;
    Vec2 m;
    Vec2 w;
    std::uint64_t collisions;
    bool finished;

    // Default constructor
    State() : x(Vec2::Zero()), v(Vec2::Zero()), m(Vec2::Ones()), w(Vec2::Ones()),
              collisions(0), finished(false) {}

    // Initial state for a configuration
    State(const InitialLayout& setup, double mass_large, double velocity_large)
        : x(setup.x_large, setup.x_small), v(velocity_large, 0.0),
          m(mass_large, setup.m_small), w(setup.w_large, setup.w_small),
          collisions(0), finished(false) {}

    double positionLarge() const { return x(idx(BodyIndex::LARGE)); }
    double positionSmall() const { return x(idx(BodyIndex::SMALL)); }
    double velocityLarge() const { return v(idx(BodyIndex::LARGE)); }
    double velocitySmall() const { return v(idx(BodyIndex::SMALL)); }
    double massLarge() const { return m(idx(BodyIndex::LARGE)); }
    double massSmall() const { return m(idx(BodyIndex::SMALL)); }
    double widthLarge() const { return w(idx(BodyIndex::LARGE)); }
    double widthSmall() const { return w(idx(BodyIndex::SMALL)); }

    // Distance between the small block's trailing edge and the large block's leading edge
    double gap() const { return positionLarge() - (positionSmall() + widthSmall()); }

    // Total linear momentum
    double momentum() const { return m.dot(v); }

    // Total kinetic energy
    double kineticEnergy() const {
        return 0.5 * (m.array() * v.array().square()).sum();
    }
};

/**
 * @brief Utility functions for state inspection
 */
namespace utils {

    inline constexpr double kPi = 3.14159265358979323846;

    /**
     * @brief Check if state satisfies the geometric and physical invariants
     */
    inline bool isValidState(const State& state) {
        return state.x.allFinite() && state.v.allFinite() &&
               state.m.allFinite() && state.w.allFinite() &&
               (state.m.array() > 0.0).all() &&
               (state.w.array() > 0.0).all() &&
               state.positionSmall() >= 0.0 &&
               state.gap() >= 0.0;
    }

    /**
     * @brief Collision count predicted by floor(pi * sqrt(m_large))
     * @param mass_large Mass of the large block relative to the small one
     * @return Theoretical collision count (display only)
     */
    inline std::uint64_t theoreticalCollisionCount(double mass_large) {
        if (!(mass_large > 0.0) || !std::isfinite(mass_large)) {
            return 0;
        }
        return static_cast<std::uint64_t>(std::floor(kPi * std::sqrt(mass_large)));
    }
}

} // namespace pi_blocks
