#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pi_blocks {
namespace config {

/**
 * @brief Configuration file problem (unreadable, malformed, out of range)
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Run configuration for the simulation driver
 */
struct SimConfig {
    double mass_large = 100.0;          // Large block mass [kg]
    double velocity_large = -100.0;     // Large block initial velocity [m/s]
    double tick_rate_hz = 60.0;         // External animation tick rate [Hz]
    std::uint64_t max_ticks = 1000000;  // Driver stops after this many ticks
    std::string log_level = "info";     // spdlog level name

    SimConfig() = default;

    // Duration of one tick [s]
    double tickInterval() const { return 1.0 / tick_rate_hz; }
};

/**
 * @brief Load configuration from YAML
 *
 * Missing keys keep their defaults.
 * @param filename Path to simulation.yaml
 * @return Configuration
 * @throws ConfigError if the file cannot be parsed or holds invalid values
 */
SimConfig loadConfig(const std::string& filename = "configs/simulation.yaml");

/**
 * @brief Parse configuration from a YAML string
 * @param text YAML document
 * @return Configuration
 * @throws ConfigError on malformed YAML or invalid values
 */
SimConfig parseConfig(const std::string& text);

} // namespace config
} // namespace pi_blocks
