#include "engine.hpp"
#include "collisions.hpp"
#include "errors.hpp"
#include "core/event_detection.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <string>

namespace pi_blocks {

CollisionEngine::CollisionEngine(const State& state) : state_(state), elapsed_(0.0) {
    if (!utils::isValidState(state_)) {
        throw InvalidConfiguration("Initial state violates positivity or contact invariants");
    }
}

CollisionEngine CollisionEngine::create(double mass_large, double velocity_large, const InitialLayout& setup) {
    if (!std::isfinite(mass_large) || mass_large <= 0.0) {
        throw InvalidConfiguration("Mass must be positive, got " + std::to_string(mass_large));
    }
    if (!std::isfinite(velocity_large)) {
        throw InvalidConfiguration("Initial velocity must be finite");
    }
    if (setup.x_large <= setup.x_small + setup.w_small) {
        throw InvalidConfiguration("Large block must start strictly right of the small block");
    }
    return CollisionEngine(State(setup, mass_large, velocity_large));
}

void CollisionEngine::advance(double dt) {
    if (!std::isfinite(dt) || dt <= 0.0) {
        throw InvalidArgument("Time step must be positive, got " + std::to_string(dt));
    }

    const std::uint64_t collisions_before = state_.collisions;
    double remaining = dt;

    while (remaining > 0.0) {
        core::CollisionEvent event = core::detectNextEvent(state_);

        if (event.type != core::EventType::NONE && event.time <= remaining) {
            // Fast-forward to the contact instant
            drift(event.time);
            remaining -= event.time;

            if (event.type == core::EventType::WALL) {
                resolveWallCollision(state_);
            } else {
                resolveBlockCollision(state_);
            }
        } else {
            drift(remaining);
            remaining = 0.0;
        }
    }
    elapsed_ += dt;

    if (state_.collisions != collisions_before) {
        spdlog::debug("advance({}): {} collisions, total {}", dt,
                      state_.collisions - collisions_before, state_.collisions);
    }

    if (!state_.finished && isTerminal(state_)) {
        state_.finished = true;
        spdlog::info("Simulation finished after {} collisions at t={:.6f}", state_.collisions, elapsed_);
    }
}

std::uint64_t CollisionEngine::runUntilFinished(double dt, std::uint64_t max_steps) {
    std::uint64_t steps = 0;
    while (!state_.finished && steps < max_steps) {
        advance(dt);
        ++steps;
    }
    return steps;
}

void CollisionEngine::drift(double t) {
    state_.x += state_.v * t;
}

std::unique_ptr<CollisionEngine> createCollisionEngine(double mass_large, double velocity_large,
                                                       const InitialLayout& setup) {
    return std::make_unique<CollisionEngine>(CollisionEngine::create(mass_large, velocity_large, setup));
}

} // namespace pi_blocks
