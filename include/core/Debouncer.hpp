#pragma once

#include "Types.hpp"
#include <functional>
#include <utility>

namespace core {

/**
 * Hysteresis gate for a per-frame integer reading (extended-finger count).
 *
 * A reading becomes stable after it has been seen K times in a row.
 * A single disagreeing frame never changes the stable value, it only
 * restarts the promotion clock for the new candidate.
 */
class Debouncer {
public:
    using ChangeCallback = std::function<void(int from, int to)>;

    explicit Debouncer(int requiredFrames = GESTURE_DEBOUNCE_FRAMES);

    /**
     * Feed one raw reading.
     * @return the (possibly unchanged) stable value
     */
    int update(int rawValue);

    /**
     * Back to the sentinel state (hand lost).
     */
    void reset();

    [[nodiscard]] int stableValue() const { return stable_; }
    [[nodiscard]] int candidateValue() const { return candidate_; }
    [[nodiscard]] int consecutiveCount() const { return consecutive_; }
    [[nodiscard]] bool isKnown() const { return stable_ != GESTURE_UNKNOWN; }
    [[nodiscard]] int requiredFrames() const { return requiredFrames_; }

    void setChangeCallback(ChangeCallback callback) { changeCallback_ = std::move(callback); }

private:
    int requiredFrames_;
    int stable_ = GESTURE_UNKNOWN;
    int candidate_ = GESTURE_UNKNOWN;
    int consecutive_ = 0;

    ChangeCallback changeCallback_;
};

} // namespace core
