#include "math/Filters.hpp"
#include <algorithm>
#include <cmath>

namespace math {

namespace {
// Used until the first valid timestamp delta has been observed
constexpr double FALLBACK_FREQUENCY_HZ = 30.0;
}

double oneEuroFilter(OneEuroState& state, const OneEuroParams& params,
                     double value, double timestamp) {
    if (!state.initialized) {
        state.prevValue = value;
        state.prevDerivative = 0.0;
        state.prevTimestamp = timestamp;
        state.frequency = 0.0;
        state.initialized = true;
        return value;
    }

    double dt = timestamp - state.prevTimestamp;
    if (dt > 0.0) {
        state.frequency = 1.0 / dt;
        state.prevTimestamp = timestamp;
    }
    double frequency = state.frequency > 0.0 ? state.frequency : FALLBACK_FREQUENCY_HZ;

    // Filtered derivative of the signal
    double dx = (value - state.prevValue) * frequency;
    double dAlpha = smoothingFactor(params.dCutoff, frequency);
    double edx = state.prevDerivative + dAlpha * (dx - state.prevDerivative);

    // Fast motion widens the pass-band
    double cutoff = params.minCutoff + params.beta * std::abs(edx);
    double alpha = smoothingFactor(cutoff, frequency);
    double result = state.prevValue + alpha * (value - state.prevValue);

    state.prevValue = result;
    state.prevDerivative = edx;
    return result;
}

LandmarkSmoother::LandmarkSmoother(OneEuroParams params)
    : params_(params) {
    reset();
}

core::LandmarkSet LandmarkSmoother::filter(const std::vector<core::Landmark>& landmarks,
                                           double timestamp) {
    core::LandmarkSet out{};
    const size_t n = std::min(landmarks.size(), core::LANDMARK_COUNT);
    for (size_t i = 0; i < n; ++i) {
        const auto& lm = landmarks[i];
        out[i].x = static_cast<float>(filterChannel(i * 3 + 0, lm.x, timestamp));
        out[i].y = static_cast<float>(filterChannel(i * 3 + 1, lm.y, timestamp));
        out[i].z = static_cast<float>(filterChannel(i * 3 + 2, lm.z, timestamp));
    }
    return out;
}

double LandmarkSmoother::filterChannel(size_t channel, double value, double timestamp) {
    return oneEuroFilter(channels_[channel], params_, value, timestamp);
}

void LandmarkSmoother::reset() {
    channels_.fill(OneEuroState{});
}

bool LandmarkSmoother::isInitialized() const {
    return channels_[0].initialized;
}

} // namespace math
