#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "core/PhysicsIntegrator.hpp"
#include "test_helpers.hpp"

using core::Hand;
using core::Mode;

class PhysicsIntegratorTest : public ::testing::Test {
protected:
    PhysicsIntegratorTest()
        : ctx(test_utils::smallConfig(4)),
          physics(ctx.particles.size()) {
        auto& p = ctx.particles;
        std::fill(p.positions.begin(), p.positions.end(), 0.0f);
        std::fill(p.targets.begin(), p.targets.end(), 0.0f);
        std::fill(p.velocities.begin(), p.velocities.end(), 0.0f);
    }

    void placeParticle(size_t i, float x, float y, float z = 0.0f) {
        ctx.particles.positions[i * 3] = x;
        ctx.particles.positions[i * 3 + 1] = y;
        ctx.particles.positions[i * 3 + 2] = z;
    }

    // Present hand with an already-eased anchor
    core::HandState& presentHand(Hand hand, const core::Vec3& anchor, float confidence = 1.0f) {
        auto& hs = ctx.hand(hand);
        hs.present = true;
        hs.confidence = confidence;
        hs.anchor.position = anchor;
        hs.anchor.initialized = true;
        return hs;
    }

    core::SimulationContext ctx;
    core::PhysicsIntegrator physics;
};

TEST_F(PhysicsIntegratorTest, IntegrateAppliesVelocityLerpAndDamping) {
    placeParticle(0, 10.0f, 0.0f);
    ctx.particles.targets[0] = 110.0f;
    ctx.particles.velocities[0] = 5.0f;

    physics.integrate(ctx);

    // pos = 10 + 5 = 15; pos += (110 - 15) * 0.16
    EXPECT_NEAR(ctx.particles.positions[0], 15.0f + 95.0f * core::LERP_FACTOR, 1e-4f);
    EXPECT_NEAR(ctx.particles.velocities[0], 5.0f * core::VELOCITY_DAMPING, 1e-6f);
}

TEST_F(PhysicsIntegratorTest, RepulsionBoundaryIsExclusive) {
    const float confidence = 0.5f;
    const float radius = core::PhysicsIntegrator::repulsionRadius(confidence);
    presentHand(Hand::Right, {0.0f, 0.0f, 0.0f}, confidence);

    placeParticle(0, radius, 0.0f);     // exactly on the boundary
    placeParticle(1, 0.0f, 0.0f);       // exactly on the anchor
    placeParticle(2, 0.0f, -radius * 2.0f);
    placeParticle(3, radius * 0.75f, 0.0f);

    physics.applyRepulsion(ctx);

    const auto& v = ctx.particles.velocities;
    EXPECT_FLOAT_EQ(v[0], 0.0f);
    EXPECT_FLOAT_EQ(v[1], 0.0f);
    EXPECT_FLOAT_EQ(v[3], 0.0f);
    EXPECT_FLOAT_EQ(v[4], 0.0f);
    EXPECT_FALSE(std::isnan(v[3]));
    EXPECT_FLOAT_EQ(v[6], 0.0f);
    EXPECT_FLOAT_EQ(v[7], 0.0f);

    // Inside the radius: pushed straight away from the anchor
    const float d = radius * 0.75f;
    const float expected = (core::REPULSION_STRENGTH / (d * d)) * core::REPULSION_FORCE_SCALE *
                           core::confidenceMultiplier(confidence);
    EXPECT_NEAR(v[9], expected, expected * 1e-4f);
    EXPECT_FLOAT_EQ(v[10], 0.0f);
}

TEST_F(PhysicsIntegratorTest, RepulsionRadiusScalesWithConfidence) {
    EXPECT_NEAR(core::PhysicsIntegrator::repulsionRadius(0.0f), core::REPULSION_RADIUS * 0.5f, 1e-4f);
    EXPECT_NEAR(core::PhysicsIntegrator::repulsionRadius(1.0f), core::REPULSION_RADIUS * 1.2f, 1e-4f);
    EXPECT_NEAR(core::PhysicsIntegrator::repulsionRadius(7.0f), core::REPULSION_RADIUS * 1.2f, 1e-4f);
}

TEST_F(PhysicsIntegratorTest, CloseTouchRequestsPulse) {
    presentHand(Hand::Right, {0.0f, 0.0f, 0.0f}, 1.0f);
    placeParticle(0, 5.0f, 0.0f);

    physics.applyRepulsion(ctx);
    EXPECT_GT(ctx.pulse.intensity, 0.0f);
}

TEST_F(PhysicsIntegratorTest, OpenRightHandDoesNotRepel) {
    auto& right = presentHand(Hand::Right, {0.0f, 0.0f, 0.0f});
    for (int i = 0; i < 3; ++i) right.debouncer.update(5);
    placeParticle(0, 5.0f, 0.0f);

    physics.applyRepulsion(ctx);
    EXPECT_FLOAT_EQ(ctx.particles.velocities[0], 0.0f);
}

TEST_F(PhysicsIntegratorTest, RepulsionSuppressedWhileDrawing) {
    presentHand(Hand::Right, {0.0f, 0.0f, 0.0f});
    placeParticle(0, 5.0f, 0.0f);
    ctx.mode = Mode::Drawing;

    physics.applyRepulsion(ctx);
    EXPECT_FLOAT_EQ(ctx.particles.velocities[0], 0.0f);
}

TEST_F(PhysicsIntegratorTest, PulseBlendsAndDecays) {
    std::fill(ctx.particles.colors.begin(), ctx.particles.colors.end(), 0.2f);
    ctx.pulse.request(0.6f, core::Rgb{1.0f, 0.0f, 0.0f});

    physics.applyPulse(ctx);

    EXPECT_NEAR(ctx.particles.colors[0], 0.2f + 0.6f * core::PULSE_BLEND, 1e-5f);
    EXPECT_NEAR(ctx.particles.colors[1], 0.2f, 1e-6f);
    EXPECT_NEAR(ctx.pulse.intensity, 0.6f * core::PULSE_DECAY, 1e-6f);

    // Channels saturate at 1
    ctx.pulse.intensity = 1.0f;
    std::fill(ctx.particles.colors.begin(), ctx.particles.colors.end(), 0.9f);
    physics.applyPulse(ctx);
    EXPECT_FLOAT_EQ(ctx.particles.colors[0], 1.0f);
}

TEST_F(PhysicsIntegratorTest, WeakPulseIsDropped) {
    ctx.pulse.intensity = core::PULSE_MIN_INTENSITY * 0.5f;
    const auto before = ctx.particles.colors;
    physics.applyPulse(ctx);
    EXPECT_FLOAT_EQ(ctx.pulse.intensity, 0.0f);
    EXPECT_EQ(ctx.particles.colors, before);
}

TEST_F(PhysicsIntegratorTest, PulseRequestsTakeTheMaximum) {
    ctx.pulse.intensity = 0.0f;
    ctx.pulse.request(0.3f, core::Rgb{1.0f, 0.0f, 0.0f});
    ctx.pulse.request(0.2f, core::Rgb{0.0f, 1.0f, 0.0f});
    EXPECT_FLOAT_EQ(ctx.pulse.intensity, 0.3f);
    EXPECT_FLOAT_EQ(ctx.pulse.color.r, 1.0f);

    ctx.pulse.request(0.8f, core::Rgb{0.0f, 1.0f, 0.0f});
    EXPECT_FLOAT_EQ(ctx.pulse.intensity, 0.8f);
    EXPECT_FLOAT_EQ(ctx.pulse.color.g, 1.0f);
}

TEST_F(PhysicsIntegratorTest, BasketballWrapsParticlesAroundPalm) {
    const core::Vec3 palm{100.0f, -50.0f, 0.0f};
    presentHand(Hand::Left, palm);
    ctx.mode = Mode::Basketball;

    physics.applyBasketball(ctx);

    const auto& shell = physics.sphereOffsets();
    ASSERT_EQ(shell.size(), ctx.particles.size());
    for (size_t i = 0; i < ctx.particles.size(); ++i) {
        const float dx = ctx.particles.targets[i * 3] - palm.x;
        const float dz = ctx.particles.targets[i * 3 + 2] - palm.z;
        // Horizontal radius of the shell is preserved by the spin
        const float horizontal = std::sqrt(shell[i].x * shell[i].x + shell[i].z * shell[i].z);
        EXPECT_NEAR(std::sqrt(dx * dx + dz * dz), horizontal, 1e-2f);
    }

    // Seam coloring
    EXPECT_FLOAT_EQ(ctx.particles.colors[0], 0.0f);
    EXPECT_FLOAT_EQ(ctx.particles.colors[3], 1.0f);
    EXPECT_NEAR(ctx.particles.colors[4], 0.53f, 1e-6f);
}

TEST_F(PhysicsIntegratorTest, BasketballNeedsLeftHand) {
    ctx.mode = Mode::Basketball;
    const auto before = ctx.particles.targets;
    physics.applyBasketball(ctx);
    EXPECT_EQ(ctx.particles.targets, before);
}

TEST_F(PhysicsIntegratorTest, CatchCarriesFormationWithPalm) {
    ctx.mode = Mode::Catch;
    ctx.particles.targets[0] = 10.0f;
    presentHand(Hand::Left, {0.0f, 0.0f, 0.0f});

    physics.applyCatch(ctx);
    EXPECT_FLOAT_EQ(ctx.particles.targets[0], 10.0f);

    ctx.hand(Hand::Left).anchor.position = {25.0f, -5.0f, 0.0f};
    physics.applyCatch(ctx);
    EXPECT_FLOAT_EQ(ctx.particles.targets[0], 35.0f);
    EXPECT_FLOAT_EQ(ctx.particles.targets[1], -5.0f);
}

TEST_F(PhysicsIntegratorTest, DrawingTracesPathOnceLongEnough) {
    ctx.mode = Mode::Drawing;
    auto& right = presentHand(Hand::Right, {0.0f, 0.0f, 0.0f});

    for (size_t i = 0; i < core::DRAWING_PATH_MIN_POINTS; ++i) {
        right.anchor.position = {static_cast<float>(i) * 10.0f, 0.0f, 0.0f};
        physics.updateDrawing(ctx);
    }
    EXPECT_EQ(ctx.drawingPath.points.size(), core::DRAWING_PATH_MIN_POINTS);
    EXPECT_FLOAT_EQ(ctx.particles.targets[3], 0.0f);   // not traced yet

    right.anchor.position = {200.0f, 40.0f, 0.0f};
    physics.updateDrawing(ctx);
    ASSERT_EQ(ctx.drawingPath.points.size(), core::DRAWING_PATH_MIN_POINTS + 1);

    // Particle i follows point floor(i * len / n)
    const size_t len = ctx.drawingPath.points.size();
    const size_t n = ctx.particles.size();
    for (size_t i = 0; i < n; ++i) {
        const auto& pt = ctx.drawingPath.points[(i * len) / n];
        EXPECT_FLOAT_EQ(ctx.particles.targets[i * 3], pt.x);
        EXPECT_FLOAT_EQ(ctx.particles.targets[i * 3 + 1], pt.y);
        EXPECT_FLOAT_EQ(ctx.particles.colors[i * 3 + 1], 0.0f);     // magenta
    }
}

TEST_F(PhysicsIntegratorTest, DrawingPathIsCapped) {
    ctx.mode = Mode::Drawing;
    presentHand(Hand::Right, {0.0f, 0.0f, 0.0f});
    for (size_t i = 0; i < core::DRAWING_PATH_CAP + 50; ++i) {
        physics.updateDrawing(ctx);
    }
    EXPECT_EQ(ctx.drawingPath.points.size(), core::DRAWING_PATH_CAP);
}

TEST_F(PhysicsIntegratorTest, RippleOnlyInNebula) {
    presentHand(Hand::Right, {0.0f, 0.0f, 0.0f});
    placeParticle(0, 30.0f, 40.0f);
    ctx.elapsed = 0.0;

    physics.applyRipple(ctx);
    EXPECT_FLOAT_EQ(ctx.particles.targets[2], 0.0f);

    ctx.mode = Mode::Nebula;
    physics.applyRipple(ctx);
    // dist 50 -> sin(1.0) * 20 * 1.2
    EXPECT_NEAR(ctx.particles.targets[2], std::sin(1.0f) * core::RIPPLE_AMPLITUDE * 1.2f, 1e-3f);
}

TEST_F(PhysicsIntegratorTest, TrailFollowsIndexTipAndIsBounded) {
    auto& right = ctx.hand(Hand::Right);
    right.present = true;
    right.landmarks = test_utils::pointing(Hand::Right);

    for (size_t i = 0; i < core::HAND_TRAIL_CAP + 10; ++i) {
        physics.updateAnchors(ctx);
    }
    EXPECT_EQ(right.trail.size(), core::HAND_TRAIL_CAP);

    const core::Vec3 tip = ctx.toWorld(right.landmarks[8]);
    EXPECT_NEAR(right.trail.back().x, tip.x, 1e-3f);
    EXPECT_NEAR(right.trail.back().y, tip.y, 1e-3f);
    EXPECT_TRUE(ctx.hand(Hand::Left).trail.empty());
}

TEST_F(PhysicsIntegratorTest, StepKeepsBufferSizes) {
    presentHand(Hand::Right, {0.0f, 0.0f, 0.0f});
    for (int i = 0; i < 10; ++i) {
        ctx.elapsed += 1.0 / 60.0;
        physics.step(ctx);
    }
    const size_t expected = ctx.particles.size() * 3;
    EXPECT_EQ(ctx.particles.positions.size(), expected);
    EXPECT_EQ(ctx.particles.targets.size(), expected);
    EXPECT_EQ(ctx.particles.velocities.size(), expected);
    EXPECT_EQ(ctx.particles.colors.size(), expected);
}
