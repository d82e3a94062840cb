#include "core/Engine.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace core {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

Engine::Engine(const Config& config, ModeStateMachine::ShapeFactory shapes)
    : ctx_(validated(config)),
      modes_(std::move(shapes)),
      physics_(config.particleCount) {

    for (auto& hs : ctx_.hands) {
        const Hand hand = hs.hand;
        hs.debouncer.setChangeCallback([hand](int from, int to) {
            Logger::info("Gesture[", handName(hand), "]: ", from, " → ", to, " fingers");
        });
    }

    Logger::info("Engine: ", ctx_.particles.size(), " particles, viewport ",
                 ctx_.config.viewportWidth, "x", ctx_.config.viewportHeight,
                 ", debounce ", ctx_.config.debounceFrames, " frames");
}

std::optional<Hand> Engine::physicalHand(const std::string& label) const {
    const std::string l = lowercase(label);
    std::optional<Hand> reported;
    if (l == "left" || l == "l") {
        reported = Hand::Left;
    } else if (l == "right" || l == "r") {
        reported = Hand::Right;
    } else {
        return std::nullopt;
    }

    // MediaPipe labels assume a mirrored (selfie) image
    if (ctx_.config.mirrorHandedness) {
        return *reported == Hand::Left ? Hand::Right : Hand::Left;
    }
    return reported;
}

bool Engine::isUsable(const HandFrame& frame) const {
    if (frame.landmarks.size() != LANDMARK_COUNT) return false;
    for (const auto& lm : frame.landmarks) {
        if (!std::isfinite(lm.x) || !std::isfinite(lm.y) || !std::isfinite(lm.z)) return false;
    }
    return std::isfinite(frame.confidence);
}

void Engine::submitHands(const std::vector<HandFrame>& frames, double timestamp) {
    submitCounter_++;

    std::array<const HandFrame*, HAND_COUNT> seen{};
    for (const auto& frame : frames) {
        auto hand = physicalHand(frame.handedness);
        if (!hand || !isUsable(frame)) {
            if (rejectedFrames_++ % 300 == 0) {
                Logger::warn("Engine: dropping hand frame (label '", frame.handedness,
                             "', ", frame.landmarks.size(), " landmarks)");
            }
            continue;
        }
        // First frame per hand wins
        if (!seen[handIndex(*hand)]) {
            seen[handIndex(*hand)] = &frame;
        }
    }

    for (auto& hs : ctx_.hands) {
        const HandFrame* frame = seen[handIndex(hs.hand)];
        if (!frame) {
            if (hs.present) {
                Logger::info("Hand lost: ", handName(hs.hand));
            }
            hs.reset();
            continue;
        }
        if (!hs.present) {
            Logger::info("Hand acquired: ", handName(hs.hand));
        }
        updateHand(hs, *frame, timestamp);
    }

    modes_.update(ctx_, transitions_,
                  ctx_.hand(Hand::Left).stableCount(),
                  ctx_.hand(Hand::Right).stableCount());
}

void Engine::updateHand(HandState& hs, const HandFrame& frame, double timestamp) {
    hs.present = true;
    hs.confidence = std::clamp(frame.confidence, 0.0f, 1.0f);
    hs.landmarks = hs.smoother.filter(frame.landmarks, timestamp);

    const auto fingers = classifier_.classify(hs.landmarks, hs.hand);
    hs.rawCount = fingers.count();
    hs.debouncer.update(hs.rawCount);

    if (submitCounter_ % 60 == 1) {
        Logger::debug("Fingers[", handName(hs.hand), "]: T=", fingers.thumb, " I=", fingers.index,
                      " M=", fingers.middle, " R=", fingers.ring, " P=", fingers.pinky,
                      " raw=", hs.rawCount, " stable=", hs.debouncer.stableValue(),
                      " conf=", hs.confidence);
    }
}

void Engine::tick(double deltaSeconds) {
    const double dt = std::max(0.0, deltaSeconds);
    ctx_.elapsed += dt;

    // Transitions only drive targets while a shape mode owns them
    if (isShapeMode(ctx_.mode)) {
        transitions_.tick(ctx_);
    }

    physics_.step(ctx_);

    stats_.frames++;
    if (dt > 0.0) {
        stats_.averageFrameMs = stats_.averageFrameMs * 0.9 + dt * 1000.0 * 0.1;
        stats_.fps = 1000.0 / stats_.averageFrameMs;
    }
    if (stats_.frames % 600 == 0) {
        Logger::debug("Engine: frame ", stats_.frames, " avg ", stats_.averageFrameMs,
                      "ms mode=", modeName(ctx_.mode));
    }
}

Engine::HandStatus Engine::handStatus(Hand hand) const {
    const auto& hs = ctx_.hand(hand);
    HandStatus status;
    status.present = hs.present;
    status.confidence = hs.present ? hs.confidence : 0.0f;
    status.stableCount = hs.present ? hs.debouncer.stableValue() : GESTURE_UNKNOWN;
    status.rawCount = hs.rawCount;
    return status;
}

} // namespace core
