#include <gtest/gtest.h>
#include <algorithm>
#include "core/TransitionController.hpp"
#include "shapes/ShapeGenerator.hpp"
#include "test_helpers.hpp"

class TransitionControllerTest : public ::testing::Test {
protected:
    TransitionControllerTest() : ctx(makeConfig()) {}

    static core::EngineConfig makeConfig() {
        auto config = test_utils::smallConfig(32);
        config.transitionStep = 0.25f;
        return config;
    }

    core::SimulationContext ctx;
    core::TransitionController transitions;
};

TEST_F(TransitionControllerTest, EmptyCloudIsRejected) {
    const auto before = ctx.particles.targets;
    EXPECT_FALSE(transitions.requestTransition(ctx, {}));
    EXPECT_FALSE(core::TransitionController::isActive(ctx));
    EXPECT_EQ(transitions.requestCount(), 0u);

    transitions.tick(ctx);
    EXPECT_EQ(ctx.particles.targets, before);
}

TEST_F(TransitionControllerTest, ReachesCloudAndClearsPendingState) {
    auto cloud = test_utils::CountingShapes::cloud(5);
    ASSERT_TRUE(transitions.requestTransition(ctx, cloud, core::Rgb{1.0f, 0.0f, 0.0f}));
    EXPECT_TRUE(core::TransitionController::isActive(ctx));
    EXPECT_FLOAT_EQ(ctx.transition.progress, 0.0f);

    for (int i = 0; i < 4; ++i) {
        transitions.tick(ctx);
    }

    EXPECT_FALSE(core::TransitionController::isActive(ctx));
    EXPECT_TRUE(ctx.transition.pending.empty());
    EXPECT_FALSE(ctx.transition.color.has_value());
    EXPECT_FLOAT_EQ(ctx.transition.progress, 1.0f);

    // Cloud indexed with i % size
    for (size_t i = 0; i < ctx.particles.size(); ++i) {
        const auto& dst = cloud[i % cloud.size()];
        EXPECT_NEAR(ctx.particles.targets[i * 3], dst.x, 1e-3f);
        EXPECT_NEAR(ctx.particles.targets[i * 3 + 1], dst.y, 1e-3f);
        EXPECT_NEAR(ctx.particles.colors[i * 3], 1.0f, 1e-4f);
        EXPECT_NEAR(ctx.particles.colors[i * 3 + 1], 0.0f, 1e-4f);
    }
}

TEST_F(TransitionControllerTest, NoInterpolationAfterCompletion) {
    transitions.requestTransition(ctx, test_utils::CountingShapes::cloud(3));
    for (int i = 0; i < 4; ++i) transitions.tick(ctx);
    ASSERT_FALSE(core::TransitionController::isActive(ctx));

    ctx.particles.targets[0] = 1234.0f;
    transitions.tick(ctx);
    transitions.tick(ctx);
    EXPECT_FLOAT_EQ(ctx.particles.targets[0], 1234.0f);
}

TEST_F(TransitionControllerTest, MovesGraduallyWithSmoothstep) {
    std::fill(ctx.particles.targets.begin(), ctx.particles.targets.end(), 0.0f);
    core::ShapePointCloud cloud(1);
    cloud[0].x = 100.0f;

    transitions.requestTransition(ctx, cloud);
    transitions.tick(ctx);

    // progress 0.25 -> smoothstep 0.15625
    EXPECT_NEAR(ctx.particles.targets[0], 15.625f, 1e-3f);
    EXPECT_TRUE(core::TransitionController::isActive(ctx));
}

TEST_F(TransitionControllerTest, NewRequestRestartsFromZero) {
    transitions.requestTransition(ctx, test_utils::CountingShapes::cloud(3));
    transitions.tick(ctx);
    transitions.tick(ctx);
    EXPECT_FLOAT_EQ(ctx.transition.progress, 0.5f);

    transitions.requestTransition(ctx, test_utils::CountingShapes::cloud(7));
    EXPECT_FLOAT_EQ(ctx.transition.progress, 0.0f);
    EXPECT_EQ(ctx.transition.pending.size(), 7u);
    EXPECT_EQ(transitions.requestCount(), 2u);
}

TEST_F(TransitionControllerTest, HueCloudColorsFollowGradient) {
    auto cloud = shapes::lissajous(ctx.particles.size());
    transitions.requestTransition(ctx, cloud);
    for (int i = 0; i < 4; ++i) transitions.tick(ctx);

    // Point 0 has hue 0 -> red
    EXPECT_NEAR(ctx.particles.colors[0], 1.0f, 1e-4f);
    EXPECT_NEAR(ctx.particles.colors[1], 0.0f, 1e-4f);
    EXPECT_NEAR(ctx.particles.colors[2], 0.0f, 1e-4f);
}

TEST(SmoothstepTest, EndpointsAndMidpoint) {
    EXPECT_FLOAT_EQ(core::TransitionController::smoothstep(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(core::TransitionController::smoothstep(0.5f), 0.5f);
    EXPECT_FLOAT_EQ(core::TransitionController::smoothstep(1.0f), 1.0f);
}
