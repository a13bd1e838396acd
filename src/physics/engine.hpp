#pragma once

#include "types.hpp"
#include <cstdint>
#include <memory>

namespace pi_blocks {

/**
 * @brief Discrete-event collision engine for the two-block system
 *
 * Advances time exactly to each collision instead of stepping:
 * - Analytic time-to-wall and time-to-block
 * - Elastic wall and block resolution
 * - Any number of collisions per advance() call
 * - Sticky terminal detection
 *
 * Not safe for concurrent mutation; callers serialize advance().
 */
class CollisionEngine {
public:
    /**
     * @brief Constructor from an arbitrary state
     * @param state Initial state, must satisfy utils::isValidState
     * @throws InvalidConfiguration if the state is invalid
     */
    explicit CollisionEngine(const State& state);

    /**
     * @brief Destructor
     */
    ~CollisionEngine() = default;

    /**
     * @brief Create an engine for a fresh configuration
     * @param mass_large Mass of the large block (> 0)
     * @param velocity_large Initial velocity of the large block
     * @param setup Start positions, widths and reference mass
     * @return Engine with the small block at rest
     * @throws InvalidConfiguration if mass_large <= 0 or a value is not finite
     */
    static CollisionEngine create(double mass_large, double velocity_large,
                                  const InitialLayout& setup = InitialLayout());

    /**
     * @brief Advance the simulation by exactly dt
     *
     * Resolves every collision inside the interval in chronological order,
     * then re-evaluates the terminal predicate. After finishing, positions
     * keep drifting with constant velocity.
     * @param dt Time step (> 0)
     * @throws InvalidArgument if dt <= 0 or not finite; state is untouched
     */
    void advance(double dt);

    /**
     * @brief Advance in fixed steps until finished
     * @param dt Time step per call
     * @param max_steps Upper bound on advance() calls
     * @return Number of steps taken
     */
    std::uint64_t runUntilFinished(double dt, std::uint64_t max_steps);

    double positionLarge() const { return state_.positionLarge(); }
    double positionSmall() const { return state_.positionSmall(); }
    double velocityLarge() const { return state_.velocityLarge(); }
    double velocitySmall() const { return state_.velocitySmall(); }
    double massLarge() const { return state_.massLarge(); }
    double massSmall() const { return state_.massSmall(); }
    double widthLarge() const { return state_.widthLarge(); }
    double widthSmall() const { return state_.widthSmall(); }
    std::uint64_t collisionCount() const { return state_.collisions; }
    bool isFinished() const { return state_.finished; }

    /**
     * @brief Total simulated time
     */
    double elapsedTime() const { return elapsed_; }

    /**
     * @brief Get full state
     * @return Reference to the current state
     */
    const State& state() const { return state_; }

private:
    State state_;
    double elapsed_;

    void drift(double t);
};

/**
 * @brief Factory function to create an engine
 * @param mass_large Mass of the large block
 * @param velocity_large Initial velocity of the large block
 * @param setup Start positions, widths and reference mass
 * @return Owning pointer to the engine
 */
std::unique_ptr<CollisionEngine> createCollisionEngine(double mass_large, double velocity_large,
                                                       const InitialLayout& setup = InitialLayout());

} // namespace pi_blocks
