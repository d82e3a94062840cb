#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core {

// ============================================================
// Particle Field Configuration
// ============================================================

constexpr size_t PARTICLE_COUNT = 12000;
constexpr float LERP_FACTOR = 0.16f;        // Position eases this fraction toward target per tick
constexpr float VELOCITY_DAMPING = 0.9f;    // Velocity multiplier per tick

// Initial scatter box (world units)
constexpr float SCATTER_INIT_X = 800.0f;
constexpr float SCATTER_INIT_Y = 600.0f;
constexpr float SCATTER_INIT_Z = 200.0f;

// Nebula scatter box
constexpr float NEBULA_SCATTER_X = 1200.0f;
constexpr float NEBULA_SCATTER_Y = 800.0f;
constexpr float NEBULA_SCATTER_Z = 600.0f;

// Viewport used to map normalized camera space to world space
constexpr int VIEWPORT_WIDTH = 1280;
constexpr int VIEWPORT_HEIGHT = 720;

// ============================================================
// Hand Input Configuration
// ============================================================

constexpr size_t LANDMARK_COUNT = 21;

// One Euro defaults for normalized landmark coordinates
constexpr double ONE_EURO_MIN_CUTOFF = 1.0;
constexpr double ONE_EURO_BETA = 0.5;
constexpr double ONE_EURO_D_CUTOFF = 1.0;

// Gesture Configuration
constexpr int GESTURE_DEBOUNCE_FRAMES = 3;     // K consecutive frames before a count is accepted
constexpr int GESTURE_UNKNOWN = -1;            // Sentinel for "no stable count"
constexpr float FINGER_TIP_MARGIN = 0.01f;     // tip must be this far above PIP (normalized y)
constexpr float FINGER_DISTANCE_RATIO = 0.95f;
constexpr float THUMB_STRAIGHT_ANGLE = 2.0f;   // radians, interior angle at the thumb MCP
constexpr float THUMB_DISTANCE_RATIO = 1.2f;

// Anchor easing (coarse smoothing of palm / fingertip screen positions)
constexpr float ANCHOR_EASING = 0.35f;

// ============================================================
// Interaction Configuration
// ============================================================

constexpr float REPULSION_STRENGTH = 80.0f;
constexpr float REPULSION_RADIUS = 80.0f;
constexpr float REPULSION_FORCE_SCALE = 100.0f;
constexpr float CONFIDENCE_MULT_MIN = 0.5f;    // confidence 0 -> 0.5x
constexpr float CONFIDENCE_MULT_MAX = 1.2f;    // confidence 1 -> 1.2x

// Nebula ripple: z += sin(dist * K1 - time * K2) * amplitude * K3
constexpr float RIPPLE_SPATIAL_FREQ = 0.02f;
constexpr float RIPPLE_TIME_FREQ = 5.0f;
constexpr float RIPPLE_AMPLITUDE = 20.0f;

// Drawing
constexpr size_t DRAWING_PATH_CAP = 600;
constexpr size_t DRAWING_PATH_MIN_POINTS = 10;  // path is traced once it holds more than this
constexpr double DRAWING_INACTIVITY_TIMEOUT_S = 10.0;

// Hand trails (renderer overlay)
constexpr size_t HAND_TRAIL_CAP = 40;

// Basketball
constexpr float BASKETBALL_RADIUS = 150.0f;
constexpr float BASKETBALL_SPIN_RATE = 0.8f;       // rad/s around the vertical axis
constexpr float BASKETBALL_BOUNCE_AMPLITUDE = 30.0f;
constexpr float BASKETBALL_DISTANCE_CEILING = 500.0f;
constexpr size_t BASKETBALL_SEAM_PERIOD = 20;

// Pulse overlay
constexpr float PULSE_MIN_INTENSITY = 0.01f;
constexpr float PULSE_BLEND = 0.5f;
constexpr float PULSE_DECAY = 0.92f;
constexpr float PULSE_TOUCH_INTENSITY = 0.35f;

// Shape transitions
constexpr float TRANSITION_STEP = 0.05f;           // progress per tick (~20 ticks)
constexpr int KOCH_ITERATIONS = 4;

// ============================================================
// Data Structures
// ============================================================

struct Landmark {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

using LandmarkSet = std::array<Landmark, LANDMARK_COUNT>;

// Physical hand (after handedness mirroring)
enum class Hand {
    Left = 0,
    Right = 1
};

constexpr size_t HAND_COUNT = 2;

inline size_t handIndex(Hand hand) { return static_cast<size_t>(hand); }
const char* handName(Hand hand);

/**
 * One tracker sample for one hand.
 * Landmarks are normalized to [0,1] camera space; z is relative depth (0 when absent).
 */
struct HandFrame {
    std::vector<Landmark> landmarks;
    std::string handedness;     // Tracker label ("Left" / "Right")
    float confidence = 0.0f;    // [0,1]
};

enum class Mode {
    Idle = 0,
    Drawing,
    Hello,
    Aruka,
    Lissajous,
    Koch,
    Catch,
    Nebula,
    Basketball
};

const char* modeName(Mode mode);

// Modes whose targets come from a ShapeGenerator cloud
inline bool isShapeMode(Mode mode) {
    return mode == Mode::Hello || mode == Mode::Aruka ||
           mode == Mode::Lissajous || mode == Mode::Koch;
}

struct Rgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct ShapePoint {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    std::optional<float> hue;   // degrees
};

using ShapePointCloud = std::vector<ShapePoint>;

/**
 * Four index-aligned buffers of 3*N floats.
 * Allocated once; never resized after construction.
 */
struct ParticleSet {
    explicit ParticleSet(size_t count)
        : positions(count * 3, 0.0f),
          targets(count * 3, 0.0f),
          velocities(count * 3, 0.0f),
          colors(count * 3, 0.0f),
          count_(count) {}

    [[nodiscard]] size_t size() const { return count_; }

    std::vector<float> positions;
    std::vector<float> targets;
    std::vector<float> velocities;
    std::vector<float> colors;

private:
    size_t count_;
};

/**
 * Runtime engine configuration, defaulted from the constants above.
 */
struct EngineConfig {
    size_t particleCount = PARTICLE_COUNT;
    int viewportWidth = VIEWPORT_WIDTH;
    int viewportHeight = VIEWPORT_HEIGHT;
    uint32_t seed = 0x5EEDu;
    bool mirrorHandedness = true;   // MediaPipe labels are mirrored w.r.t. the user
    double minCutoff = ONE_EURO_MIN_CUTOFF;
    double beta = ONE_EURO_BETA;
    double dCutoff = ONE_EURO_D_CUTOFF;
    float transitionStep = TRANSITION_STEP;
    int debounceFrames = GESTURE_DEBOUNCE_FRAMES;

    /**
     * Throws std::invalid_argument on impossible values.
     */
    void validate() const;
};

} // namespace core
