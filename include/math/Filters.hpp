#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <vector>

#include "core/Types.hpp"

namespace math {

struct OneEuroParams {
    double minCutoff = 1.0;
    double beta = 0.007;
    double dCutoff = 1.0;
};

/**
 * State of one One Euro channel.
 * `initialized == false` means no sample has been seen since construction or reset.
 */
struct OneEuroState {
    double prevValue = 0.0;
    double prevDerivative = 0.0;
    double prevTimestamp = 0.0;
    double frequency = 0.0;     // Hz, last valid sampling frequency estimate
    bool initialized = false;
};

/**
 * Advance one channel by a sample.
 * First sample (or first after reset) is returned unchanged and seeds the state.
 * A non-positive timestamp delta keeps the previous frequency estimate.
 */
double oneEuroFilter(OneEuroState& state, const OneEuroParams& params,
                     double value, double timestamp);

// Exponential smoothing coefficient for a cutoff frequency at a sampling rate
inline double smoothingFactor(double cutoff, double frequency) {
    double tau = 1.0 / (2.0 * M_PI * cutoff);
    double te = 1.0 / frequency;
    return 1.0 / (1.0 + tau / te);
}

/**
 * Signal conditioner for one hand: 21 landmarks x 3 coordinates,
 * one One Euro channel each.
 */
class LandmarkSmoother {
public:
    static constexpr size_t CHANNEL_COUNT = core::LANDMARK_COUNT * 3;

    explicit LandmarkSmoother(OneEuroParams params = {});

    /**
     * Filter a full landmark set.
     * @param landmarks exactly 21 landmarks (caller validates)
     * @param timestamp seconds, monotonic
     */
    core::LandmarkSet filter(const std::vector<core::Landmark>& landmarks, double timestamp);

    double filterChannel(size_t channel, double value, double timestamp);

    /**
     * Forget everything. Called whenever the owning hand disappears.
     */
    void reset();

    [[nodiscard]] bool isInitialized() const;
    [[nodiscard]] const OneEuroState& channel(size_t index) const { return channels_[index]; }

private:
    OneEuroParams params_;
    std::array<OneEuroState, CHANNEL_COUNT> channels_{};
};

} // namespace math
