#pragma once

#include "types.hpp"
#include <utility>

namespace pi_blocks {

/**
 * @brief 1-D perfectly elastic collision
 *
 * Conserves momentum and kinetic energy:
 *   v1' = ((m1 - m2) u1 + 2 m2 u2) / (m1 + m2)
 *   v2' = ((m2 - m1) u2 + 2 m1 u1) / (m1 + m2)
 *
 * @param m1 Mass of the first body
 * @param m2 Mass of the second body
 * @param u1 Pre-collision velocity of the first body
 * @param u2 Pre-collision velocity of the second body
 * @return Pair of post-collision velocities (v1', v2')
 */
std::pair<double, double> elasticVelocities(double m1, double m2, double u1, double u2);

/**
 * @brief Reflect the small block off the wall
 *
 * Flips the small block's velocity, places it exactly at the wall
 * and counts the collision.
 * @param state State at the contact instant
 */
void resolveWallCollision(State& state);

/**
 * @brief Resolve a block-block collision
 *
 * Applies the elastic formulas to the pre-collision velocities, places
 * the large block exactly in contact and counts the collision.
 * @param state State at the contact instant
 */
void resolveBlockCollision(State& state);

/**
 * @brief Check whether no further collision can ever occur
 * @param state Current state
 * @return True once both blocks recede and the large one never catches up
 */
bool isTerminal(const State& state);

} // namespace pi_blocks
