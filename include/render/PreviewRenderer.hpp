#pragma once

#include <deque>
#include <string>
#include <opencv2/core.hpp>

#include "core/Engine.hpp"

namespace render {

/**
 * Software preview of the particle field.
 * Perspective camera on the +z axis looking at the origin, additive point
 * splats, holo trails for both index fingertips and a one-line status bar.
 */
class PreviewRenderer {
public:
    struct Config {
        int width = 960;
        int height = 540;
        float cameraZ = 600.0f;
        float fovDegrees = 75.0f;       // vertical
        float pointAlpha = 0.8f;
        bool drawTrails = true;
        bool drawStatus = true;
    };

    explicit PreviewRenderer(const Config& config);

    /**
     * Render the current engine state. The returned frame (CV_8UC3, BGR)
     * stays valid until the next call.
     */
    const cv::Mat& render(const core::Engine& engine);

    /**
     * World -> pixel. Returns false for points behind (or on) the camera.
     */
    bool project(const core::Vec3& world, cv::Point2f& pixel) const;

    static std::string statusLine(const core::Engine& engine);

    [[nodiscard]] float focalLength() const { return _focal; }

private:
    void splatParticles(const core::Engine& engine);
    void drawTrail(const std::deque<core::Vec3>& trail, const cv::Scalar& color,
                   float alpha, float width);
    void drawStatusBar(const std::string& text);

    Config _config;
    float _focal;

    cv::Mat _accum;     // CV_32FC3, additive buffer in [0,1]
    cv::Mat _frame;     // CV_8UC3 output
};

} // namespace render
