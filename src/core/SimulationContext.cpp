#include "core/SimulationContext.hpp"
#include <algorithm>

namespace core {

void Anchor::ease(const Vec3& raw, float factor) {
    if (!initialized) {
        position = raw;
        initialized = true;
        return;
    }
    position.x += (raw.x - position.x) * factor;
    position.y += (raw.y - position.y) * factor;
    position.z += (raw.z - position.z) * factor;
}

HandState::HandState(Hand hand, const math::OneEuroParams& filterParams, int debounceFrames)
    : hand(hand),
      smoother(filterParams),
      debouncer(debounceFrames) {
}

void HandState::reset() {
    present = false;
    confidence = 0.0f;
    rawCount = GESTURE_UNKNOWN;
    landmarks = LandmarkSet{};
    smoother.reset();
    debouncer.reset();
    anchor.reset();
    tipAnchor.reset();
    trail.clear();
}

std::optional<int> HandState::stableCount() const {
    if (!present || !debouncer.isKnown()) return std::nullopt;
    return debouncer.stableValue();
}

void PulseState::request(float requested, const Rgb& requestedColor) {
    if (requested > intensity) {
        intensity = requested;
        color = requestedColor;
    }
}

void DrawingPath::append(const Vec3& point, double now) {
    points.push_back(point);
    while (points.size() > DRAWING_PATH_CAP) {
        points.pop_front();
    }
    lastAppendTime = now;
}

void DrawingPath::clear() {
    points.clear();
}

SimulationContext::SimulationContext(const EngineConfig& cfg)
    : config(cfg),
      particles(cfg.particleCount),
      hands{HandState(Hand::Left, {cfg.minCutoff, cfg.beta, cfg.dCutoff}, cfg.debounceFrames),
            HandState(Hand::Right, {cfg.minCutoff, cfg.beta, cfg.dCutoff}, cfg.debounceFrames)},
      rng(cfg.seed) {
    scatterInitial();
}

Vec3 SimulationContext::toWorld(const Landmark& lm) const {
    return {
        (lm.x - 0.5f) * static_cast<float>(config.viewportWidth),
        -(lm.y - 0.5f) * static_cast<float>(config.viewportHeight),
        0.0f
    };
}

void SimulationContext::scatterInitial() {
    std::uniform_real_distribution<float> unit(-0.5f, 0.5f);
    auto& p = particles;
    for (size_t i = 0; i < p.size(); ++i) {
        const size_t i3 = i * 3;
        p.positions[i3] = unit(rng) * SCATTER_INIT_X;
        p.positions[i3 + 1] = unit(rng) * SCATTER_INIT_Y;
        p.positions[i3 + 2] = unit(rng) * SCATTER_INIT_Z;

        p.targets[i3] = p.positions[i3];
        p.targets[i3 + 1] = p.positions[i3 + 1];
        p.targets[i3 + 2] = p.positions[i3 + 2];

        p.colors[i3] = 0.0f;
        p.colors[i3 + 1] = 1.0f;
        p.colors[i3 + 2] = 1.0f;
    }
    std::fill(p.velocities.begin(), p.velocities.end(), 0.0f);
}

float confidenceMultiplier(float confidence) {
    float c = std::clamp(confidence, 0.0f, 1.0f);
    return CONFIDENCE_MULT_MIN + (CONFIDENCE_MULT_MAX - CONFIDENCE_MULT_MIN) * c;
}

} // namespace core
