#include "collisions.hpp"
#include <spdlog/spdlog.h>

namespace pi_blocks {

std::pair<double, double> elasticVelocities(double m1, double m2, double u1, double u2) {
    double total = m1 + m2;
    double v1 = ((m1 - m2) * u1 + 2.0 * m2 * u2) / total;
    double v2 = ((m2 - m1) * u2 + 2.0 * m1 * u1) / total;
    return {v1, v2};
}

void resolveWallCollision(State& state) {
    const int s = idx(BodyIndex::SMALL);
    state.v(s) = -state.v(s);
    state.x(s) = 0.0;
    state.collisions += 1;

    spdlog::trace("wall collision #{}: v_small={}", state.collisions, state.v(s));
}

void resolveBlockCollision(State& state) {
    const int l = idx(BodyIndex::LARGE);
    const int s = idx(BodyIndex::SMALL);

    auto [v1, v2] = elasticVelocities(state.m(l), state.m(s), state.v(l), state.v(s));
    state.v(l) = v1;
    state.v(s) = v2;

    // Contact: large leading edge on small trailing edge
    state.x(l) = state.x(s) + state.w(s);
    state.collisions += 1;

    spdlog::trace("block collision #{}: v_large={} v_small={}", state.collisions, v1, v2);
}

bool isTerminal(const State& state) {
    const double v1 = state.velocityLarge();
    const double v2 = state.velocitySmall();
    return v1 >= 0.0 && v2 >= 0.0 && v1 >= v2;
}

} // namespace pi_blocks
