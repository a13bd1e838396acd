#pragma once

#include "../physics/engine.hpp"
#include "../utils/config.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace pi_blocks {

/**
 * @brief Read-only snapshot handed to a renderer once per tick
 */
struct Frame {
    double x_large = 0.0;
    double x_small = 0.0;
    double v_large = 0.0;
    double v_small = 0.0;
    double w_large = 0.0;
    double w_small = 0.0;
    double m_large = 0.0;
    double large_display_size = 0.0;    // Log-scaled draw size of the large block
    std::uint64_t collisions = 0;
    std::uint64_t theoretical_collisions = 0;
    bool finished = false;
};

/**
 * @brief Configuration layer owning at most one active engine
 *
 * Reconfiguration replaces the engine wholesale; a rejected
 * configuration leaves the current engine in place.
 */
class SimulationSession {
public:
    /**
     * @brief Constructor
     * @param cfg Run configuration (tick rate)
     */
    explicit SimulationSession(const config::SimConfig& cfg);

    /**
     * @brief Replace the engine with a fresh configuration
     * @param mass_large Mass of the large block
     * @param velocity_large Initial velocity of the large block
     * @return Theoretical collision count for the new configuration
     * @throws InvalidConfiguration if the values are rejected
     */
    std::uint64_t configure(double mass_large, double velocity_large);

    /**
     * @brief Replace the engine from user-entered text
     * @param mass_text Mass field contents
     * @param velocity_text Velocity field contents
     * @return Theoretical collision count for the new configuration
     * @throws InvalidConfiguration on non-numeric text or rejected values
     */
    std::uint64_t configureFromText(const std::string& mass_text, const std::string& velocity_text);

    /**
     * @brief Advance the active engine by one tick interval
     * @return False if no engine is configured
     */
    bool tick();

    /**
     * @brief Snapshot of the active engine
     */
    Frame frame() const;

    bool hasEngine() const { return engine_ != nullptr; }
    const CollisionEngine* engine() const { return engine_.get(); }
    double tickInterval() const { return tick_interval_; }

private:
    std::unique_ptr<CollisionEngine> engine_;
    double tick_interval_;
};

/**
 * @brief Draw size of the large block, log-scaled and clamped to [80, 250]
 * @param mass_large Mass of the large block
 * @return Edge length in display units
 */
double largeDisplaySize(double mass_large);

} // namespace pi_blocks
