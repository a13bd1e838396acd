#include <cstdint>
#include <iostream>
#include <iomanip>
#include <string>
#include <stdexcept>
#include "../src/physics/engine.hpp"
#include "../src/sim/session.hpp"
#include "../src/utils/config.hpp"
#include "../src/utils/logging.hpp"

using namespace pi_blocks;

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : "configs/simulation.yaml";

    config::SimConfig cfg;
    try {
        cfg = config::loadConfig(config_path);
    } catch (const config::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    logging::init(cfg.log_level);

    std::cout << "=== Colliding Blocks Demo ===" << std::endl;
    std::cout << std::fixed << std::setprecision(3);

    SimulationSession session(cfg);
    std::uint64_t theory = 0;
    try {
        if (argc > 3) {
            theory = session.configureFromText(argv[2], argv[3]);
        } else {
            theory = session.configure(cfg.mass_large, cfg.velocity_large);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return 1;
    }

    Frame start = session.frame();
    std::cout << "\n--- Configuration ---" << std::endl;
    std::cout << "Mass large [kg]: " << start.m_large << std::endl;
    std::cout << "Velocity large [m/s]: " << start.v_large << std::endl;
    std::cout << "Tick interval [s]: " << session.tickInterval() << std::endl;
    std::cout << "Theoretical count: " << theory << std::endl;

    std::uint64_t ticks = 0;
    while (!session.frame().finished && ticks < cfg.max_ticks) {
        session.tick();
        ++ticks;
    }

    Frame end = session.frame();
    std::cout << "\n--- Result ---" << std::endl;
    std::cout << "Ticks: " << ticks << std::endl;
    std::cout << "Simulated time [s]: " << session.engine()->elapsedTime() << std::endl;
    std::cout << "Collisions: " << end.collisions << std::endl;
    std::cout << "Finished: " << (end.finished ? "yes" : "no") << std::endl;
    std::cout << "Velocities [m/s]: (" << end.v_large << ", " << end.v_small << ")" << std::endl;

    if (!end.finished) {
        std::cout << "Stopped after max_ticks before the blocks separated" << std::endl;
        return 2;
    }
    return 0;
}
