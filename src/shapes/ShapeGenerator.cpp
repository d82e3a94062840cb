#include "shapes/ShapeGenerator.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace shapes {

core::ShapePointCloud textCoordinates(const std::string& text) {
    core::ShapePointCloud coords;
    if (text.empty()) {
        return coords;
    }

    cv::Mat canvas = cv::Mat::zeros(TEXT_CANVAS_HEIGHT, TEXT_CANVAS_WIDTH, CV_8UC1);

    const int fontFace = cv::FONT_HERSHEY_SIMPLEX;
    const double fontScale = cv::getFontScaleFromHeight(fontFace, TEXT_FONT_PIXELS, TEXT_THICKNESS);

    // Center horizontally and around the vertical middle (like textBaseline = middle)
    int baseline = 0;
    cv::Size textSize = cv::getTextSize(text, fontFace, fontScale, TEXT_THICKNESS, &baseline);
    cv::Point origin((TEXT_CANVAS_WIDTH - textSize.width) / 2,
                     (TEXT_CANVAS_HEIGHT + textSize.height) / 2);

    cv::putText(canvas, text, origin, fontFace, fontScale, cv::Scalar(255),
                TEXT_THICKNESS, cv::LINE_AA);

    const float halfW = TEXT_CANVAS_WIDTH / 2.0f;
    const float halfH = TEXT_CANVAS_HEIGHT / 2.0f;

    for (int y = 0; y < canvas.rows; y += TEXT_SAMPLE_STRIDE) {
        const uchar* row = canvas.ptr<uchar>(y);
        for (int x = 0; x < canvas.cols; x += TEXT_SAMPLE_STRIDE) {
            if (row[x] > TEXT_LUMA_THRESHOLD) {
                core::ShapePoint p;
                p.x = (static_cast<float>(x) - halfW) * TEXT_SCALE;
                p.y = -(static_cast<float>(y) - halfH) * TEXT_SCALE;
                p.z = 0.0f;
                coords.push_back(p);
            }
        }
    }

    if (coords.empty()) {
        core::Logger::warn("ShapeGenerator: text \"", text, "\" rasterized to zero points");
    }
    return coords;
}

core::ShapePointCloud lissajous(size_t count, const LissajousParams& params) {
    core::ShapePointCloud coords;
    coords.reserve(count);

    const float span = 2.0f * static_cast<float>(M_PI) * std::max(params.a, params.b);
    for (size_t i = 0; i < count; ++i) {
        float frac = static_cast<float>(i) / static_cast<float>(count);
        float t = frac * span;

        core::ShapePoint p;
        p.x = params.amplitudeX * std::sin(params.a * t + params.delta);
        p.y = params.amplitudeY * std::sin(params.b * t);
        p.z = 0.0f;
        p.hue = frac * 360.0f;
        coords.push_back(p);
    }
    return coords;
}

namespace {

struct Point2 {
    float x;
    float y;
};

// Appends the Koch curve p1 -> p2 to `out`, including both endpoints.
void kochCurve(const Point2& p1, const Point2& p2, int depth, std::vector<Point2>& out) {
    if (depth <= 0) {
        out.push_back(p1);
        out.push_back(p2);
        return;
    }

    const float dx = p2.x - p1.x;
    const float dy = p2.y - p1.y;

    const Point2 p3{p1.x + dx / 3.0f, p1.y + dy / 3.0f};
    const Point2 p5{p1.x + 2.0f * dx / 3.0f, p1.y + 2.0f * dy / 3.0f};

    // Edges run counter-clockwise, so a clockwise turn puts the bump outside
    const float angle = static_cast<float>(-M_PI / 3.0);
    const Point2 p4{
        p3.x + (dx / 3.0f) * std::cos(angle) - (dy / 3.0f) * std::sin(angle),
        p3.y + (dx / 3.0f) * std::sin(angle) + (dy / 3.0f) * std::cos(angle)
    };

    // Sub-curves share endpoints; drop each one's last point except the final curve's
    const Point2 segments[5] = {p1, p3, p4, p5, p2};
    for (int s = 0; s < 4; ++s) {
        std::vector<Point2> sub;
        kochCurve(segments[s], segments[s + 1], depth - 1, sub);
        if (s < 3) sub.pop_back();
        out.insert(out.end(), sub.begin(), sub.end());
    }
}

} // namespace

core::ShapePointCloud kochSnowflake(int iterations, size_t count) {
    core::ShapePointCloud coords;
    if (count == 0) return coords;

    const float s = KOCH_SIZE;
    const float h = s * std::sqrt(3.0f) / 2.0f;
    const Point2 a{0.0f, -s};
    const Point2 b{h, s / 2.0f};
    const Point2 c{-h, s / 2.0f};

    std::vector<Point2> all;
    kochCurve(a, b, iterations, all);
    kochCurve(b, c, iterations, all);
    kochCurve(c, a, iterations, all);

    // Index scaling, not arc length: density follows vertex density
    coords.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        size_t idx = static_cast<size_t>(
            std::floor(static_cast<double>(i) / static_cast<double>(count) * all.size()));
        idx = std::min(idx, all.size() - 1);
        core::ShapePoint p;
        p.x = all[idx].x;
        p.y = all[idx].y;
        p.z = 0.0f;
        coords.push_back(p);
    }
    return coords;
}

core::ShapePointCloud fibonacciSphere(size_t count, float radius) {
    core::ShapePointCloud coords;
    if (count == 0) return coords;

    if (count == 1) {
        core::ShapePoint p;
        p.y = radius;
        coords.push_back(p);
        return coords;
    }

    coords.reserve(count);
    const double phi = M_PI * (3.0 - std::sqrt(5.0));   // golden angle

    for (size_t i = 0; i < count; ++i) {
        double y = 1.0 - (static_cast<double>(i) / static_cast<double>(count - 1)) * 2.0;
        double radiusAtY = std::sqrt(std::max(0.0, 1.0 - y * y));
        double theta = phi * static_cast<double>(i);

        core::ShapePoint p;
        p.x = static_cast<float>(std::cos(theta) * radiusAtY * radius);
        p.y = static_cast<float>(y * radius);
        p.z = static_cast<float>(std::sin(theta) * radiusAtY * radius);
        coords.push_back(p);
    }
    return coords;
}

namespace {

float hueToChannel(float p, float q, float t) {
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 1.0f / 2.0f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
    return p;
}

} // namespace

core::Rgb hslToRgb(float h, float s, float l) {
    if (s == 0.0f) {
        return {l, l, l};
    }

    const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
    const float p = 2.0f * l - q;
    return {
        std::clamp(hueToChannel(p, q, h + 1.0f / 3.0f), 0.0f, 1.0f),
        std::clamp(hueToChannel(p, q, h), 0.0f, 1.0f),
        std::clamp(hueToChannel(p, q, h - 1.0f / 3.0f), 0.0f, 1.0f)
    };
}

} // namespace shapes
