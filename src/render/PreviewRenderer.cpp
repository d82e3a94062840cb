#include "render/PreviewRenderer.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace render {

namespace {

// BGR
const cv::Scalar TRAIL_CYAN(255, 255, 0);
const cv::Scalar TRAIL_MAGENTA(255, 0, 255);
const cv::Scalar TRAIL_GREEN(136, 255, 0);

constexpr size_t MIN_TRAIL_POINTS = 3;

std::string handSummary(const core::Engine::HandStatus& status) {
    if (!status.present) return "-";
    std::ostringstream ss;
    if (status.stableCount == core::GESTURE_UNKNOWN) {
        ss << "?";
    } else {
        ss << status.stableCount;
    }
    ss << " (" << std::fixed << std::setprecision(2) << status.confidence << ")";
    return ss.str();
}

} // namespace

PreviewRenderer::PreviewRenderer(const Config& config)
    : _config(config) {
    if (config.width <= 0 || config.height <= 0) {
        throw std::invalid_argument("PreviewRenderer: preview size must be positive");
    }
    if (config.fovDegrees <= 0.0f || config.fovDegrees >= 180.0f) {
        throw std::invalid_argument("PreviewRenderer: field of view must be in (0, 180)");
    }

    const float halfFov = config.fovDegrees * static_cast<float>(M_PI) / 360.0f;
    _focal = (static_cast<float>(config.height) * 0.5f) / std::tan(halfFov);

    _accum = cv::Mat(config.height, config.width, CV_32FC3);
    _frame = cv::Mat(config.height, config.width, CV_8UC3);
}

bool PreviewRenderer::project(const core::Vec3& world, cv::Point2f& pixel) const {
    const float depth = _config.cameraZ - world.z;
    if (depth <= 1.0f) return false;

    const float s = _focal / depth;
    pixel.x = static_cast<float>(_config.width) * 0.5f + world.x * s;
    pixel.y = static_cast<float>(_config.height) * 0.5f - world.y * s;
    return true;
}

const cv::Mat& PreviewRenderer::render(const core::Engine& engine) {
    splatParticles(engine);
    _accum.convertTo(_frame, CV_8UC3, 255.0);

    if (_config.drawTrails) {
        const bool drawing = engine.mode() == core::Mode::Drawing;
        drawTrail(engine.trail(core::Hand::Right),
                  drawing ? TRAIL_MAGENTA : TRAIL_CYAN,
                  drawing ? 1.0f : 0.6f,
                  drawing ? 4.0f : 2.0f);
        drawTrail(engine.trail(core::Hand::Left), TRAIL_GREEN, 0.4f, 1.5f);
    }

    if (_config.drawStatus) {
        drawStatusBar(statusLine(engine));
    }

    return _frame;
}

void PreviewRenderer::splatParticles(const core::Engine& engine) {
    _accum.setTo(cv::Scalar::all(0));

    const auto& positions = engine.positions();
    const auto& colors = engine.colors();
    const float alpha = _config.pointAlpha;
    const int w = _config.width;
    const int h = _config.height;

    for (size_t i3 = 0; i3 + 2 < positions.size(); i3 += 3) {
        cv::Point2f px;
        if (!project({positions[i3], positions[i3 + 1], positions[i3 + 2]}, px)) continue;

        const int x0 = static_cast<int>(std::floor(px.x));
        const int y0 = static_cast<int>(std::floor(px.y));
        const cv::Vec3f add(colors[i3 + 2] * alpha, colors[i3 + 1] * alpha, colors[i3] * alpha);

        // 2x2 splat
        for (int y = y0; y < y0 + 2; ++y) {
            if (y < 0 || y >= h) continue;
            auto* row = _accum.ptr<cv::Vec3f>(y);
            for (int x = x0; x < x0 + 2; ++x) {
                if (x < 0 || x >= w) continue;
                row[x] += add;
            }
        }
    }
}

void PreviewRenderer::drawTrail(const std::deque<core::Vec3>& trail, const cv::Scalar& color,
                                float alpha, float width) {
    const size_t len = trail.size();
    if (len < MIN_TRAIL_POINTS) return;

    cv::Mat overlay = cv::Mat::zeros(_frame.size(), _frame.type());

    cv::Point2f prev;
    bool havePrev = project(trail[0], prev);
    for (size_t i = 1; i < len; ++i) {
        cv::Point2f curr;
        if (!project(trail[i], curr)) {
            havePrev = false;
            continue;
        }
        if (havePrev) {
            // Quadratic fade toward the tail
            const float t = static_cast<float>(i) / static_cast<float>(len);
            const float segAlpha = alpha * t * t;
            const int thickness = std::max(1, static_cast<int>(std::lround(width * (0.3f + t * 0.7f))));
            cv::line(overlay, prev, curr, color * segAlpha, thickness, cv::LINE_AA);
        }
        prev = curr;
        havePrev = true;
    }

    cv::Point2f tip;
    if (project(trail.back(), tip)) {
        cv::circle(overlay, tip, static_cast<int>(std::lround(width * 3.0f)), color * (alpha * 0.3f),
                   cv::FILLED, cv::LINE_AA);
        cv::circle(overlay, tip, std::max(1, static_cast<int>(std::lround(width))), color * alpha,
                   cv::FILLED, cv::LINE_AA);
    }

    cv::add(_frame, overlay, _frame);
}

void PreviewRenderer::drawStatusBar(const std::string& text) {
    cv::rectangle(_frame, cv::Point(0, 0), cv::Point(_config.width, 28), cv::Scalar(0, 0, 0), cv::FILLED);
    cv::putText(_frame, text, cv::Point(10, 20), cv::FONT_HERSHEY_SIMPLEX, 0.55,
                cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
}

std::string PreviewRenderer::statusLine(const core::Engine& engine) {
    std::ostringstream ss;
    ss << "mode: " << core::modeName(engine.mode())
       << " | L: " << handSummary(engine.handStatus(core::Hand::Left))
       << " | R: " << handSummary(engine.handStatus(core::Hand::Right))
       << " | " << std::fixed << std::setprecision(1) << engine.frameStats().fps << " fps";
    return ss.str();
}

} // namespace render
