#include "core/Debouncer.hpp"
#include <algorithm>

namespace core {

Debouncer::Debouncer(int requiredFrames)
    : requiredFrames_(std::max(1, requiredFrames)) {
    reset();
}

void Debouncer::reset() {
    stable_ = GESTURE_UNKNOWN;
    candidate_ = GESTURE_UNKNOWN;
    consecutive_ = 0;
}

int Debouncer::update(int rawValue) {
    if (rawValue == candidate_) {
        consecutive_++;
    } else {
        candidate_ = rawValue;
        consecutive_ = 1;
    }

    // Promote after K consistent frames
    if (consecutive_ >= requiredFrames_ && candidate_ != stable_) {
        int previous = stable_;
        stable_ = candidate_;
        if (changeCallback_) {
            changeCallback_(previous, stable_);
        }
    }

    return stable_;
}

} // namespace core
