#include <gtest/gtest.h>
#include <cmath>
#include "../src/sim/session.hpp"
#include "../src/physics/errors.hpp"
#include "../src/utils/config.hpp"

using namespace pi_blocks;

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.tick_rate_hz = 60.0;
    }

    config::SimConfig cfg_;
};

TEST_F(SessionTest, StartsWithoutEngine) {
    SimulationSession session(cfg_);

    EXPECT_FALSE(session.hasEngine());
    EXPECT_FALSE(session.tick());

    Frame frame = session.frame();
    EXPECT_EQ(frame.collisions, 0u);
    EXPECT_FALSE(frame.finished);
}

TEST_F(SessionTest, ConfigureReturnsTheoreticalCount) {
    SimulationSession session(cfg_);
    EXPECT_EQ(session.configure(100.0, -100.0), 31u);
    EXPECT_TRUE(session.hasEngine());
    EXPECT_DOUBLE_EQ(session.tickInterval(), 1.0 / 60.0);
}

TEST_F(SessionTest, TicksUntilFinished) {
    SimulationSession session(cfg_);
    session.configure(100.0, -100.0);

    int ticks = 0;
    while (!session.frame().finished && ticks < 100000) {
        ASSERT_TRUE(session.tick());
        ++ticks;
    }

    Frame frame = session.frame();
    EXPECT_TRUE(frame.finished);
    EXPECT_EQ(frame.collisions, 31u);
    EXPECT_EQ(frame.theoretical_collisions, 31u);
    EXPECT_NEAR(session.engine()->elapsedTime(), ticks / 60.0, 1e-9);
}

TEST_F(SessionTest, ReconfigureReplacesEngine) {
    SimulationSession session(cfg_);
    session.configure(100.0, -100.0);
    for (int i = 0; i < 200; ++i) {
        session.tick();
    }
    ASSERT_GT(session.frame().collisions, 0u);
    const CollisionEngine* old_engine = session.engine();

    session.configure(10000.0, -50.0);
    Frame frame = session.frame();

    EXPECT_NE(session.engine(), old_engine);
    EXPECT_EQ(frame.collisions, 0u);
    EXPECT_EQ(frame.m_large, 10000.0);
    EXPECT_EQ(frame.v_large, -50.0);
    EXPECT_EQ(frame.v_small, 0.0);
    EXPECT_FALSE(frame.finished);
}

TEST_F(SessionTest, RejectedConfigurationKeepsEngine) {
    SimulationSession session(cfg_);
    session.configure(100.0, -100.0);
    session.tick();
    Frame before = session.frame();

    EXPECT_THROW(session.configure(-1.0, -100.0), InvalidConfiguration);
    EXPECT_THROW(session.configure(0.0, -100.0), InvalidConfiguration);

    Frame after = session.frame();
    EXPECT_EQ(after.m_large, before.m_large);
    EXPECT_EQ(after.x_large, before.x_large);
    EXPECT_EQ(after.collisions, before.collisions);
}

TEST_F(SessionTest, ConfigureFromText) {
    SimulationSession session(cfg_);
    EXPECT_EQ(session.configureFromText("10000", "-50.0"), 314u);
    EXPECT_EQ(session.frame().m_large, 10000.0);

    EXPECT_EQ(session.configureFromText(" 100 ", "-100"), 31u);
    EXPECT_EQ(session.frame().v_large, -100.0);
}

TEST_F(SessionTest, ConfigureFromTextRejectsBadInput) {
    SimulationSession session(cfg_);
    EXPECT_THROW(session.configureFromText("abc", "-100"), InvalidConfiguration);
    EXPECT_THROW(session.configureFromText("100kg", "-100"), InvalidConfiguration);
    EXPECT_THROW(session.configureFromText("100", ""), InvalidConfiguration);
    EXPECT_THROW(session.configureFromText("-5", "-100"), InvalidConfiguration);
    EXPECT_THROW(session.configureFromText("nan", "-100"), InvalidConfiguration);
    EXPECT_FALSE(session.hasEngine());
}

TEST_F(SessionTest, RejectsNonPositiveTickRate) {
    cfg_.tick_rate_hz = 0.0;
    EXPECT_THROW({ SimulationSession session(cfg_); }, InvalidConfiguration);
}

// Test presentation helpers
TEST_F(SessionTest, LargeDisplaySize) {
    EXPECT_DOUBLE_EQ(largeDisplaySize(1.0), 80.0);        // 50 + 20, clamped up
    EXPECT_DOUBLE_EQ(largeDisplaySize(100.0), 90.0);      // 50 + 40
    EXPECT_DOUBLE_EQ(largeDisplaySize(10000.0), 130.0);   // 50 + 80
    EXPECT_DOUBLE_EQ(largeDisplaySize(1e12), 250.0);      // clamped down
}

TEST_F(SessionTest, FrameCarriesGeometry) {
    SimulationSession session(cfg_);
    session.configure(100.0, -100.0);
    Frame frame = session.frame();

    EXPECT_EQ(frame.x_large, 400.0);
    EXPECT_EQ(frame.x_small, 200.0);
    EXPECT_EQ(frame.w_large, 150.0);
    EXPECT_EQ(frame.w_small, 50.0);
    EXPECT_DOUBLE_EQ(frame.large_display_size, 90.0);
}
