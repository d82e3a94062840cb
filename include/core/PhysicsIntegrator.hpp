#pragma once

#include "SimulationContext.hpp"

namespace core {

/**
 * Per-frame particle update.
 *
 * Order: anchors -> basketball -> drawing -> catch -> repulsion ->
 * nebula ripple -> pulse overlay -> integration.
 * The individual passes are public so they can be exercised in isolation.
 */
class PhysicsIntegrator {
public:
    explicit PhysicsIntegrator(size_t particleCount);

    void step(SimulationContext& ctx);

    void updateAnchors(SimulationContext& ctx);
    void applyBasketball(SimulationContext& ctx);
    void updateDrawing(SimulationContext& ctx);
    void applyCatch(SimulationContext& ctx);
    void applyRepulsion(SimulationContext& ctx);
    void applyRipple(SimulationContext& ctx);
    void applyPulse(SimulationContext& ctx);
    void integrate(SimulationContext& ctx);

    [[nodiscard]] static float repulsionRadius(float confidence);

    [[nodiscard]] const ShapePointCloud& sphereOffsets() const { return sphereOffsets_; }

private:
    ShapePointCloud sphereOffsets_;     // Basketball shell, computed once

    Vec3 lastCatchAnchor_;
    bool catchAnchorValid_ = false;
};

} // namespace core
