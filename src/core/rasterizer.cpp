#include "rasterizer.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace tekanim::core {
namespace {

constexpr uint8_t k_beam_r = 0;
constexpr uint8_t k_beam_g = 255;
constexpr uint8_t k_beam_b = 0;

void plot(RasterFrame& frame, long x, long y) {
    if (x < 0 || y < 0 || x >= frame.width || y >= frame.height) {
        return;
    }
    const long row = frame.height - 1 - y;
    const size_t idx = (static_cast<size_t>(row) * frame.width + static_cast<size_t>(x)) * 3;
    frame.pixels[idx + 0] = k_beam_r;
    frame.pixels[idx + 1] = k_beam_g;
    frame.pixels[idx + 2] = k_beam_b;
}

// Bresenham.
void draw_line(RasterFrame& frame, long x0, long y0, long x1, long y1) {
    const long dx = std::labs(x1 - x0);
    const long dy = -std::labs(y1 - y0);
    const long sx = x0 < x1 ? 1 : -1;
    const long sy = y0 < y1 ? 1 : -1;
    long err = dx + dy;
    while (true) {
        plot(frame, x0, y0);
        if (x0 == x1 && y0 == y1) {
            break;
        }
        const long e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

// Liang-Barsky: trims a..b to the pixel centres' rectangle, padded by half a
// pixel. Returns false when nothing of the segment is left.
bool clip_segment(const RasterFrame& frame, Point& a, Point& b) {
    const double min_x = -0.5;
    const double min_y = -0.5;
    const double max_x = frame.width - 0.5;
    const double max_y = frame.height - 0.5;
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    double t0 = 0.0;
    double t1 = 1.0;
    const double p[4] = {-dx, dx, -dy, dy};
    const double q[4] = {a.x - min_x, max_x - a.x, a.y - min_y, max_y - a.y};
    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) {
                return false;
            }
            continue;
        }
        const double t = q[i] / p[i];
        if (p[i] < 0.0) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
        if (t0 > t1) {
            return false;
        }
    }
    const Point start = a;
    a = {start.x + t0 * dx, start.y + t0 * dy};
    b = {start.x + t1 * dx, start.y + t1 * dy};
    return true;
}

void draw_segment(RasterFrame& frame, Point a, Point b) {
    if (!clip_segment(frame, a, b)) {
        return;
    }
    draw_line(frame, std::lround(a.x), std::lround(a.y), std::lround(b.x), std::lround(b.y));
}

} // namespace

bool raster_frame_size(const Bounds& canvas, int& width, int& height, Error& error) {
    double needed_width = k_min_raster_width;
    double needed_height = k_min_raster_height;
    if (canvas.valid) {
        needed_width = std::max(needed_width, std::ceil(canvas.max_x) + 1.0);
        needed_height = std::max(needed_height, std::ceil(canvas.max_y) + 1.0);
    }
    if (needed_width > k_max_raster_dimension || needed_height > k_max_raster_dimension) {
        return fail(error, ErrorKind::Range,
                    "canvas does not fit the largest raster frame ("
                        + std::to_string(k_max_raster_dimension) + "x"
                        + std::to_string(k_max_raster_dimension) + ")");
    }
    width = static_cast<int>(needed_width);
    height = static_cast<int>(needed_height);
    width += width % 2;
    height += height % 2;
    return true;
}

RasterFrame rasterize(const Strokes& strokes, int width, int height) {
    RasterFrame frame(width, height);
    for (const auto& stroke : strokes) {
        if (stroke.empty()) {
            continue;
        }
        if (stroke.size() == 1) {
            draw_segment(frame, stroke.front(), stroke.front());
            continue;
        }
        for (size_t i = 1; i < stroke.size(); ++i) {
            draw_segment(frame, stroke[i - 1], stroke[i]);
        }
    }
    return frame;
}

} // namespace tekanim::core
