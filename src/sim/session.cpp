#include "session.hpp"
#include "../physics/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace pi_blocks {

namespace {

double parseNumber(const std::string& text, const char* field) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidConfiguration(std::string("Invalid numeric value for ") + field + ": '" + text + "'");
    }
    // Allow surrounding whitespace only
    while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed]))) {
        ++consumed;
    }
    if (consumed != text.size()) {
        throw InvalidConfiguration(std::string("Invalid numeric value for ") + field + ": '" + text + "'");
    }
    return value;
}

} // namespace

SimulationSession::SimulationSession(const config::SimConfig& cfg)
    : tick_interval_(cfg.tickInterval()) {
    if (!std::isfinite(tick_interval_) || tick_interval_ <= 0.0) {
        throw InvalidConfiguration("Tick rate must be positive");
    }
}

std::uint64_t SimulationSession::configure(double mass_large, double velocity_large) {
    // Build first so a rejected configuration keeps the old engine
    std::unique_ptr<CollisionEngine> fresh = createCollisionEngine(mass_large, velocity_large);
    engine_ = std::move(fresh);

    std::uint64_t theory = utils::theoreticalCollisionCount(mass_large);
    spdlog::info("Configured m_large={} v_large={} (theoretical count {})",
                 mass_large, velocity_large, theory);
    return theory;
}

std::uint64_t SimulationSession::configureFromText(const std::string& mass_text,
                                                   const std::string& velocity_text) {
    double mass = parseNumber(mass_text, "mass");
    double velocity = parseNumber(velocity_text, "velocity");
    return configure(mass, velocity);
}

bool SimulationSession::tick() {
    if (!engine_) {
        return false;
    }
    engine_->advance(tick_interval_);
    return true;
}

Frame SimulationSession::frame() const {
    Frame f;
    if (!engine_) {
        return f;
    }
    f.x_large = engine_->positionLarge();
    f.x_small = engine_->positionSmall();
    f.v_large = engine_->velocityLarge();
    f.v_small = engine_->velocitySmall();
    f.w_large = engine_->widthLarge();
    f.w_small = engine_->widthSmall();
    f.m_large = engine_->massLarge();
    f.large_display_size = largeDisplaySize(f.m_large);
    f.collisions = engine_->collisionCount();
    f.theoretical_collisions = utils::theoreticalCollisionCount(f.m_large);
    f.finished = engine_->isFinished();
    return f;
}

double largeDisplaySize(double mass_large) {
    double size_scale = mass_large > 1.0 ? std::log10(mass_large) * 20.0 : 20.0;
    return std::clamp(50.0 + size_scale, 80.0, 250.0);
}

} // namespace pi_blocks
