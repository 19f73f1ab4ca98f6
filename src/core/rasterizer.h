#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "error.h"
#include "geometry.h"

namespace tekanim::core {

constexpr int k_min_raster_width = 1024;
constexpr int k_min_raster_height = 780;
constexpr int k_max_raster_dimension = 8192;

// Packed rgb24, rows top to bottom.
struct RasterFrame {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    RasterFrame() = default;
    RasterFrame(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h * 3, 0) {}
};

// Frame size able to hold `canvas`, at least 1024x780, even in both
// dimensions. A canvas reaching past k_max_raster_dimension is a RangeError.
bool raster_frame_size(const Bounds& canvas, int& width, int& height, Error& error);

// Draws 1-pixel green strokes on black. Coordinates have y up, like the
// device screen; anything outside the frame is clipped.
RasterFrame rasterize(const Strokes& strokes, int width, int height);

} // namespace tekanim::core
