#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"
#include "SimulationContext.hpp"
#include "GestureClassifier.hpp"
#include "ModeStateMachine.hpp"
#include "TransitionController.hpp"
#include "PhysicsIntegrator.hpp"

namespace core {

/**
 * Gesture-driven particle field.
 *
 * Single-threaded: the host calls submitHands() whenever the tracker delivers
 * a result and tick() once per render frame, from the same thread.
 * The latest submitted hands stay in effect until the next submission.
 */
class Engine {
public:
    using Config = EngineConfig;

    struct HandStatus {
        bool present = false;
        float confidence = 0.0f;
        int stableCount = GESTURE_UNKNOWN;
        int rawCount = GESTURE_UNKNOWN;
    };

    struct FrameStats {
        double averageFrameMs = 1000.0 / 60.0;
        double fps = 60.0;
        uint64_t frames = 0;
    };

    /**
     * Throws std::invalid_argument if the config does not validate.
     */
    explicit Engine(const Config& config = Config{},
                    ModeStateMachine::ShapeFactory shapes = ModeStateMachine::ShapeFactory::defaults());

    /**
     * Tracker callback: zero, one or two hands.
     * Every hand without a usable frame here is reset.
     * @param timestamp seconds, monotonic (drives the One Euro filters)
     */
    void submitHands(const std::vector<HandFrame>& frames, double timestamp);

    /**
     * Advance the simulation by one render frame.
     */
    void tick(double deltaSeconds);

    // Renderer-facing buffers (3*N floats, stride 3)
    [[nodiscard]] const std::vector<float>& positions() const { return ctx_.particles.positions; }
    [[nodiscard]] const std::vector<float>& colors() const { return ctx_.particles.colors; }

    [[nodiscard]] const ParticleSet& particles() const { return ctx_.particles; }
    ParticleSet& particles() { return ctx_.particles; }

    [[nodiscard]] Mode mode() const { return ctx_.mode; }
    [[nodiscard]] HandStatus handStatus(Hand hand) const;
    [[nodiscard]] const std::deque<Vec3>& trail(Hand hand) const { return ctx_.hand(hand).trail; }
    [[nodiscard]] const std::deque<Vec3>& drawingPath() const { return ctx_.drawingPath.points; }
    [[nodiscard]] const FrameStats& frameStats() const { return stats_; }
    [[nodiscard]] double elapsed() const { return ctx_.elapsed; }
    [[nodiscard]] const Config& config() const { return ctx_.config; }

    void requestPulse(float intensity, const Rgb& color) { ctx_.pulse.request(intensity, color); }

    SimulationContext& context() { return ctx_; }
    [[nodiscard]] const SimulationContext& context() const { return ctx_; }
    ModeStateMachine& modes() { return modes_; }
    [[nodiscard]] const TransitionController& transitions() const { return transitions_; }

    /**
     * Map a tracker handedness label to the physical hand.
     * @return nullopt for unrecognized labels
     */
    [[nodiscard]] std::optional<Hand> physicalHand(const std::string& label) const;

private:
    [[nodiscard]] bool isUsable(const HandFrame& frame) const;
    void updateHand(HandState& hs, const HandFrame& frame, double timestamp);

    SimulationContext ctx_;
    GestureClassifier classifier_;
    ModeStateMachine modes_;
    TransitionController transitions_;
    PhysicsIntegrator physics_;

    FrameStats stats_;
    uint64_t submitCounter_ = 0;
    uint64_t rejectedFrames_ = 0;
};

} // namespace core
