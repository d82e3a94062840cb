#pragma once

#include <cmath>
#include <cstddef>
#include <string>

#include "core/Types.hpp"

namespace shapes {

/**
 * Static target point clouds.
 * All functions are deterministic; cloud length is independent of the
 * particle count, so consumers index with `i % size()` after checking for
 * an empty cloud.
 */

// Offscreen text raster parameters
constexpr int TEXT_CANVAS_WIDTH = 1200;
constexpr int TEXT_CANVAS_HEIGHT = 400;
constexpr int TEXT_FONT_PIXELS = 75;
constexpr int TEXT_THICKNESS = 5;
constexpr int TEXT_SAMPLE_STRIDE = 3;
constexpr int TEXT_LUMA_THRESHOLD = 128;
constexpr float TEXT_SCALE = 0.8f;

struct LissajousParams {
    float a = 3.0f;
    float b = 2.0f;
    float delta = static_cast<float>(M_PI / 2.0);
    float amplitudeX = 300.0f;
    float amplitudeY = 300.0f;
};

constexpr float KOCH_SIZE = 350.0f;

/**
 * Rasterize text onto a 1200x400 bitmap (centered, bold Hershey simplex
 * at ~75px), keep pixels above the luma threshold on a 3px grid, and map
 * them into a centered plane (y up, z = 0).
 * Empty text yields an empty cloud.
 */
core::ShapePointCloud textCoordinates(const std::string& text);

/**
 * x = A sin(a t + delta), y = B sin(b t), t swept over [0, 2 pi max(a,b)).
 * Point i carries hue (i / count) * 360.
 */
core::ShapePointCloud lissajous(size_t count, const LissajousParams& params = {});

/**
 * Koch snowflake of the given recursion depth, resampled to `count` points
 * by index scaling over the concatenated edge polylines (not arc length).
 */
core::ShapePointCloud kochSnowflake(int iterations, size_t count);

/**
 * Golden-angle spiral on a sphere of `radius`.
 * count == 0 -> empty, count == 1 -> single point at the north pole.
 */
core::ShapePointCloud fibonacciSphere(size_t count, float radius);

/**
 * HSL -> RGB. h, s, l in [0,1]; output channels in [0,1].
 */
core::Rgb hslToRgb(float h, float s, float l);

} // namespace shapes
