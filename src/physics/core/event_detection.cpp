#include "physics/core/event_detection.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pi_blocks {
namespace core {

static constexpr double kNever = std::numeric_limits<double>::infinity();

double timeToWall(const State& state) {
    const double v = state.velocitySmall();
    if (v < 0.0) {
        // Rounding can leave the block a hair past the wall
        return std::max(0.0, state.positionSmall()) / std::abs(v);
    }
    return kNever;
}

double timeToBlock(const State& state) {
    const double u1 = state.velocityLarge();
    const double u2 = state.velocitySmall();
    if (u1 < u2) {
        double closing_speed = u2 - u1;
        return std::max(0.0, state.gap()) / closing_speed;
    }
    return kNever;
}

CollisionEvent detectNextEvent(const State& state) {
    double t_wall = timeToWall(state);
    double t_block = timeToBlock(state);

    if (std::isinf(t_wall) && std::isinf(t_block)) {
        return {EventType::NONE, kNever};
    }
    if (t_wall < t_block) {
        return {EventType::WALL, t_wall};
    }
    return {EventType::BLOCK, t_block};
}

} // namespace core
} // namespace pi_blocks
