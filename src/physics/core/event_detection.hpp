#pragma once

#include "physics/types.hpp"

namespace pi_blocks {
namespace core {

enum class EventType {
    NONE,       // No collision can happen from this state
    WALL,       // Small block reaches the wall
    BLOCK       // Large block reaches the small block
};

struct CollisionEvent {
    EventType type;
    double time;    // Time until the event, +inf for NONE
};

// Time until the small block hits the wall, +inf unless it moves toward it.
double timeToWall(const State& state);

// Time until the blocks touch, +inf unless the large block is closing in.
double timeToBlock(const State& state);

// Earliest upcoming event. Exact ties resolve as BLOCK.
CollisionEvent detectNextEvent(const State& state);

} // namespace core
} // namespace pi_blocks
