#include "core/PhysicsIntegrator.hpp"
#include "core/GestureClassifier.hpp"
#include "core/Logger.hpp"
#include "shapes/ShapeGenerator.hpp"

#include <algorithm>
#include <cmath>

namespace core {

namespace {
constexpr Rgb DRAWING_COLOR{1.0f, 0.0f, 1.0f};
constexpr Rgb BALL_COLOR{1.0f, 0.53f, 0.0f};
constexpr Rgb SEAM_COLOR{0.0f, 0.0f, 0.0f};
constexpr Rgb TOUCH_PULSE_COLOR{0.0f, 1.0f, 1.0f};

using LI = GestureClassifier::LandmarkIndices;
}

PhysicsIntegrator::PhysicsIntegrator(size_t particleCount)
    : sphereOffsets_(shapes::fibonacciSphere(particleCount, BASKETBALL_RADIUS)) {
}

void PhysicsIntegrator::step(SimulationContext& ctx) {
    updateAnchors(ctx);
    applyBasketball(ctx);
    updateDrawing(ctx);
    applyCatch(ctx);
    applyRepulsion(ctx);
    applyRipple(ctx);
    applyPulse(ctx);
    integrate(ctx);
}

float PhysicsIntegrator::repulsionRadius(float confidence) {
    return REPULSION_RADIUS * confidenceMultiplier(confidence);
}

void PhysicsIntegrator::updateAnchors(SimulationContext& ctx) {
    for (auto& hs : ctx.hands) {
        if (!hs.present) continue;

        const int anchorIdx = (hs.hand == Hand::Left) ? LI::PALM_CENTER : LI::INDEX_TIP;
        hs.anchor.ease(ctx.toWorld(hs.landmarks[anchorIdx]), ANCHOR_EASING);

        hs.tipAnchor.ease(ctx.toWorld(hs.landmarks[LI::INDEX_TIP]), ANCHOR_EASING);
        hs.trail.push_back(hs.tipAnchor.position);
        while (hs.trail.size() > HAND_TRAIL_CAP) {
            hs.trail.pop_front();
        }
    }
}

void PhysicsIntegrator::applyBasketball(SimulationContext& ctx) {
    const auto& left = ctx.hand(Hand::Left);
    if (ctx.mode != Mode::Basketball || !left.present || !left.anchor.initialized) return;
    if (sphereOffsets_.empty()) return;

    auto& p = ctx.particles;
    const Vec3 palm = left.anchor.position;
    const float angle = static_cast<float>(ctx.elapsed) * BASKETBALL_SPIN_RATE;
    const float c = std::cos(angle);
    const float s = std::sin(angle);
    const size_t shellSize = sphereOffsets_.size();

    for (size_t i = 0; i < p.size(); ++i) {
        const size_t i3 = i * 3;
        const ShapePoint& off = sphereOffsets_[i % shellSize];

        // Spin about the vertical axis
        const float rx = off.x * c + off.z * s;
        const float rz = -off.x * s + off.z * c;

        const float tx = palm.x + rx;
        const float ty = palm.y + off.y;
        const float tz = palm.z + rz;

        const float dx = tx - p.positions[i3];
        const float dy = ty - p.positions[i3 + 1];
        const float dz = tz - p.positions[i3 + 2];
        const float dist = std::sqrt(dx * dx + dy * dy + dz * dz);
        const float progress = 1.0f - std::min(dist / BASKETBALL_DISTANCE_CEILING, 1.0f);
        const float bounce = std::sin(progress * static_cast<float>(M_PI) * 8.0f) *
                             BASKETBALL_BOUNCE_AMPLITUDE * (1.0f - progress);

        p.targets[i3] = tx;
        p.targets[i3 + 1] = ty + bounce;
        p.targets[i3 + 2] = tz;

        const Rgb& col = (i % BASKETBALL_SEAM_PERIOD == 0) ? SEAM_COLOR : BALL_COLOR;
        p.colors[i3] = col.r;
        p.colors[i3 + 1] = col.g;
        p.colors[i3 + 2] = col.b;
    }
}

void PhysicsIntegrator::updateDrawing(SimulationContext& ctx) {
    auto& path = ctx.drawingPath;
    const auto& right = ctx.hand(Hand::Right);

    if (ctx.mode == Mode::Drawing && right.present && right.anchor.initialized) {
        path.append(right.anchor.position, ctx.elapsed);

        if (path.points.size() > DRAWING_PATH_MIN_POINTS) {
            auto& p = ctx.particles;
            const size_t n = p.size();
            const size_t len = path.points.size();
            for (size_t i = 0; i < n; ++i) {
                const size_t i3 = i * 3;
                size_t idx = (i * len) / n;
                const Vec3& pt = path.points[std::min(idx, len - 1)];

                p.targets[i3] = pt.x;
                p.targets[i3 + 1] = pt.y;
                p.targets[i3 + 2] = 0.0f;

                p.colors[i3] = DRAWING_COLOR.r;
                p.colors[i3 + 1] = DRAWING_COLOR.g;
                p.colors[i3 + 2] = DRAWING_COLOR.b;
            }
        }
    }

    // Wall-clock inactivity, checked every tick
    if (!path.points.empty() &&
        ctx.elapsed - path.lastAppendTime > DRAWING_INACTIVITY_TIMEOUT_S) {
        Logger::info("Drawing: path idle for ", DRAWING_INACTIVITY_TIMEOUT_S,
                     "s, clearing ", path.points.size(), " points");
        path.clear();
    }
}

void PhysicsIntegrator::applyCatch(SimulationContext& ctx) {
    const auto& left = ctx.hand(Hand::Left);
    if (ctx.mode != Mode::Catch || !left.present || !left.anchor.initialized) {
        catchAnchorValid_ = false;
        return;
    }

    const Vec3 palm = left.anchor.position;
    if (catchAnchorValid_) {
        // Carry the current formation with the palm
        const float dx = palm.x - lastCatchAnchor_.x;
        const float dy = palm.y - lastCatchAnchor_.y;
        const float dz = palm.z - lastCatchAnchor_.z;
        auto& targets = ctx.particles.targets;
        for (size_t i = 0; i < ctx.particles.size(); ++i) {
            const size_t i3 = i * 3;
            targets[i3] += dx;
            targets[i3 + 1] += dy;
            targets[i3 + 2] += dz;
        }
    }
    lastCatchAnchor_ = palm;
    catchAnchorValid_ = true;
}

void PhysicsIntegrator::applyRepulsion(SimulationContext& ctx) {
    const auto& right = ctx.hand(Hand::Right);
    if (!right.present || !right.anchor.initialized) return;
    if (right.debouncer.stableValue() >= 5) return;
    if (ctx.mode == Mode::Basketball || ctx.mode == Mode::Drawing) return;

    const float mult = confidenceMultiplier(right.confidence);
    const float radius = repulsionRadius(right.confidence);
    const float touchRadius = radius * 0.5f;
    const Vec3 tip = right.anchor.position;

    auto& p = ctx.particles;
    bool touched = false;

    for (size_t i = 0; i < p.size(); ++i) {
        const size_t i3 = i * 3;
        const float dx = p.positions[i3] - tip.x;
        const float dy = p.positions[i3 + 1] - tip.y;
        const float dist = std::sqrt(dx * dx + dy * dy);

        // Exclusive boundary; a particle exactly on the anchor has no direction
        if (dist <= 0.0f || dist >= radius) continue;

        const float force = (REPULSION_STRENGTH / (dist * dist)) * REPULSION_FORCE_SCALE * mult;
        p.velocities[i3] += (dx / dist) * force;
        p.velocities[i3 + 1] += (dy / dist) * force;

        if (dist < touchRadius) touched = true;
    }

    if (touched) {
        ctx.pulse.request(PULSE_TOUCH_INTENSITY * mult, TOUCH_PULSE_COLOR);
    }
}

void PhysicsIntegrator::applyRipple(SimulationContext& ctx) {
    const auto& right = ctx.hand(Hand::Right);
    if (ctx.mode != Mode::Nebula || !right.present || !right.anchor.initialized) return;

    const float amplitude = RIPPLE_AMPLITUDE * confidenceMultiplier(right.confidence);
    const float phase = static_cast<float>(ctx.elapsed) * RIPPLE_TIME_FREQ;
    const Vec3 tip = right.anchor.position;

    auto& p = ctx.particles;
    for (size_t i = 0; i < p.size(); ++i) {
        const size_t i3 = i * 3;
        const float dx = p.positions[i3] - tip.x;
        const float dy = p.positions[i3 + 1] - tip.y;
        const float dist = std::sqrt(dx * dx + dy * dy);
        p.targets[i3 + 2] += std::sin(dist * RIPPLE_SPATIAL_FREQ - phase) * amplitude;
    }
}

void PhysicsIntegrator::applyPulse(SimulationContext& ctx) {
    auto& pulse = ctx.pulse;
    if (pulse.intensity <= PULSE_MIN_INTENSITY) {
        pulse.intensity = 0.0f;
        return;
    }

    const float k = pulse.intensity * PULSE_BLEND;
    const float addR = pulse.color.r * k;
    const float addG = pulse.color.g * k;
    const float addB = pulse.color.b * k;

    auto& colors = ctx.particles.colors;
    for (size_t i3 = 0; i3 < colors.size(); i3 += 3) {
        colors[i3] = std::min(1.0f, colors[i3] + addR);
        colors[i3 + 1] = std::min(1.0f, colors[i3 + 1] + addG);
        colors[i3 + 2] = std::min(1.0f, colors[i3 + 2] + addB);
    }

    pulse.intensity *= PULSE_DECAY;
}

void PhysicsIntegrator::integrate(SimulationContext& ctx) {
    auto& p = ctx.particles;
    const size_t n = p.positions.size();
    for (size_t k = 0; k < n; ++k) {
        p.positions[k] += p.velocities[k];
        p.positions[k] += (p.targets[k] - p.positions[k]) * LERP_FACTOR;
        p.velocities[k] *= VELOCITY_DAMPING;
    }
}

} // namespace core
