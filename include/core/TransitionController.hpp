#pragma once

#include <optional>

#include "SimulationContext.hpp"

namespace core {

/**
 * Morphs the live target/color buffers toward a requested point cloud.
 *
 * Policy: every request animates from the current targets, with progress
 * starting at 0 and advancing a fixed step per tick, eased by smoothstep.
 */
class TransitionController {
public:
    /**
     * Replace any pending transition.
     * @param color fixed color, or nullopt to use per-point hue (if any)
     * @return false (and no state change) for an empty cloud
     */
    bool requestTransition(SimulationContext& ctx, ShapePointCloud cloud,
                           std::optional<Rgb> color = std::nullopt);

    /**
     * Advance one frame. No-op when nothing is pending.
     */
    void tick(SimulationContext& ctx);

    [[nodiscard]] static bool isActive(const SimulationContext& ctx) { return ctx.transition.active; }

    [[nodiscard]] static float smoothstep(float x) { return x * x * (3.0f - 2.0f * x); }

    [[nodiscard]] size_t requestCount() const { return requestCount_; }

private:
    size_t requestCount_ = 0;
};

} // namespace core
