#pragma once

#include <array>
#include <deque>
#include <optional>
#include <random>

#include "Types.hpp"
#include "Debouncer.hpp"
#include "math/Filters.hpp"

namespace core {

/**
 * Screen-space reference point eased toward the latest raw landmark position.
 */
struct Anchor {
    Vec3 position;
    bool initialized = false;

    void ease(const Vec3& raw, float factor);
    void reset() { *this = Anchor{}; }
};

/**
 * Everything remembered about one physical hand.
 * Created at startup, fully reset (never partially) when the hand is lost.
 */
struct HandState {
    HandState(Hand hand, const math::OneEuroParams& filterParams, int debounceFrames);

    Hand hand;
    bool present = false;
    float confidence = 0.0f;
    int rawCount = GESTURE_UNKNOWN;

    LandmarkSet landmarks{};            // SignalConditioner output
    math::LandmarkSmoother smoother;
    Debouncer debouncer;

    Anchor anchor;                      // palm (left) / index tip (right)
    Anchor tipAnchor;                   // index tip, drives the trail
    std::deque<Vec3> trail;             // index tip history, newest at back

    void reset();

    // Stable count if present and known
    [[nodiscard]] std::optional<int> stableCount() const;
};

struct PulseState {
    float intensity = 0.0f;
    Rgb color{0.0f, 1.0f, 1.0f};

    // Never sums: keeps the stronger of the current and requested pulse
    void request(float requested, const Rgb& requestedColor);
};

struct TransitionState {
    float progress = 1.0f;
    ShapePointCloud pending;
    std::optional<Rgb> color;
    bool active = false;
};

struct DrawingPath {
    std::deque<Vec3> points;
    double lastAppendTime = 0.0;

    void append(const Vec3& point, double now);
    void clear();
};

/**
 * Single owner of all mutable simulation state.
 * Components receive it explicitly; nothing here is global.
 */
struct SimulationContext {
    explicit SimulationContext(const EngineConfig& config);

    EngineConfig config;
    ParticleSet particles;
    std::array<HandState, HAND_COUNT> hands;

    Mode mode = Mode::Idle;
    TransitionState transition;
    PulseState pulse;
    DrawingPath drawingPath;

    double elapsed = 0.0;       // seconds, advanced by Engine::tick
    std::mt19937 rng;

    HandState& hand(Hand h) { return hands[handIndex(h)]; }
    [[nodiscard]] const HandState& hand(Hand h) const { return hands[handIndex(h)]; }

    // Normalized camera space -> world space (origin centered, y up)
    [[nodiscard]] Vec3 toWorld(const Landmark& lm) const;

    // Deterministic initial scatter, identity targets
    void scatterInitial();
};

// Map detection confidence [0,1] to an effect multiplier [0.5, 1.2]
float confidenceMultiplier(float confidence);

} // namespace core
