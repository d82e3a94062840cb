#include "core/TransitionController.hpp"
#include "core/Logger.hpp"
#include "shapes/ShapeGenerator.hpp"
#include <algorithm>

namespace core {

bool TransitionController::requestTransition(SimulationContext& ctx, ShapePointCloud cloud,
                                             std::optional<Rgb> color) {
    if (cloud.empty()) {
        Logger::warn("TransitionController: ignoring request with empty cloud");
        return false;
    }

    auto& ts = ctx.transition;
    ts.pending = std::move(cloud);
    ts.color = color;
    ts.progress = 0.0f;
    ts.active = true;
    requestCount_++;

    Logger::info("TransitionController: started (", ts.pending.size(), " points)");
    return true;
}

void TransitionController::tick(SimulationContext& ctx) {
    auto& ts = ctx.transition;
    if (!ts.active || ts.pending.empty()) return;

    ts.progress = std::min(1.0f, ts.progress + ctx.config.transitionStep);
    const float t = smoothstep(ts.progress);

    auto& targets = ctx.particles.targets;
    auto& colors = ctx.particles.colors;
    const size_t count = ctx.particles.size();
    const size_t cloudSize = ts.pending.size();

    for (size_t i = 0; i < count; ++i) {
        const size_t i3 = i * 3;
        const ShapePoint& dst = ts.pending[i % cloudSize];

        targets[i3] += (dst.x - targets[i3]) * t;
        targets[i3 + 1] += (dst.y - targets[i3 + 1]) * t;
        targets[i3 + 2] += (dst.z - targets[i3 + 2]) * t;

        std::optional<Rgb> want = ts.color;
        if (!want && dst.hue) {
            want = shapes::hslToRgb(*dst.hue / 360.0f, 1.0f, 0.5f);
        }
        if (want) {
            colors[i3] += (want->r - colors[i3]) * t;
            colors[i3 + 1] += (want->g - colors[i3 + 1]) * t;
            colors[i3 + 2] += (want->b - colors[i3 + 2]) * t;
        }
    }

    if (ts.progress >= 1.0f) {
        ts.active = false;
        ts.pending.clear();
        ts.color.reset();
        Logger::info("TransitionController: finished");
    }
}

} // namespace core
