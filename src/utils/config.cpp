#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>

namespace pi_blocks {
namespace config {

namespace {

SimConfig fromNode(const YAML::Node& root) {
    SimConfig cfg;

    if (const YAML::Node sim = root["simulation"]) {
        if (sim["mass_large"]) cfg.mass_large = sim["mass_large"].as<double>();
        if (sim["velocity_large"]) cfg.velocity_large = sim["velocity_large"].as<double>();
        if (sim["tick_rate_hz"]) cfg.tick_rate_hz = sim["tick_rate_hz"].as<double>();
        if (sim["max_ticks"]) cfg.max_ticks = sim["max_ticks"].as<std::uint64_t>();
    }
    if (const YAML::Node log = root["logging"]) {
        if (log["level"]) cfg.log_level = log["level"].as<std::string>();
    }

    if (!std::isfinite(cfg.mass_large) || cfg.mass_large <= 0.0) {
        throw ConfigError("simulation.mass_large must be positive");
    }
    if (!std::isfinite(cfg.velocity_large)) {
        throw ConfigError("simulation.velocity_large must be finite");
    }
    if (!std::isfinite(cfg.tick_rate_hz) || cfg.tick_rate_hz <= 0.0) {
        throw ConfigError("simulation.tick_rate_hz must be positive");
    }
    return cfg;
}

} // namespace

SimConfig loadConfig(const std::string& filename) {
    try {
        return fromNode(YAML::LoadFile(filename));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load " + filename + ": " + e.what());
    }
}

SimConfig parseConfig(const std::string& text) {
    try {
        return fromNode(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

} // namespace config
} // namespace pi_blocks
