#include <catch2/catch_test_macros.hpp>

#include "core/rasterizer.h"

using namespace tekanim::core;

namespace {

bool is_lit(const RasterFrame& frame, int x, int y) {
    const size_t row = static_cast<size_t>(frame.height - 1 - y);
    const size_t idx = (row * static_cast<size_t>(frame.width) + static_cast<size_t>(x)) * 3;
    return frame.pixels[idx] == 0 && frame.pixels[idx + 1] == 255 && frame.pixels[idx + 2] == 0;
}

size_t lit_count(const RasterFrame& frame) {
    size_t count = 0;
    for (size_t i = 0; i + 2 < frame.pixels.size(); i += 3) {
        if (frame.pixels[i + 1] == 255) {
            ++count;
        }
    }
    return count;
}

} // namespace

TEST_CASE("Raster frames hold the canvas at an even size", "[raster]") {
    int width = 0;
    int height = 0;
    Error error;

    SECTION("the default canvas fits the minimum frame") {
        REQUIRE(raster_frame_size(make_bounds(0, 0, 1000, 779), width, height, error));
        CHECK(width == 1024);
        CHECK(height == 780);
    }

    SECTION("larger canvases grow the frame") {
        REQUIRE(raster_frame_size(make_bounds(0, 0, 2000, 1000.5), width, height, error));
        CHECK(width == 2002);
        CHECK(height == 1002);
    }

    SECTION("the largest frame") {
        REQUIRE(raster_frame_size(make_bounds(0, 0, 8191, 100), width, height, error));
        CHECK(width == k_max_raster_dimension);
    }

    SECTION("huge canvases are rejected") {
        CHECK_FALSE(raster_frame_size(make_bounds(0, 0, 8192, 100), width, height, error));
        CHECK(error.kind == ErrorKind::Range);
        CHECK_FALSE(raster_frame_size(make_bounds(0, 0, 100, 1e300), width, height, error));
        CHECK(error.kind == ErrorKind::Range);
    }
}

TEST_CASE("Strokes are drawn with y pointing up", "[raster]") {
    const RasterFrame frame = rasterize({{{0, 0}, {3, 0}}, {{6, 3}}}, 8, 4);
    REQUIRE(frame.pixels.size() == 8 * 4 * 3);

    CHECK(is_lit(frame, 0, 0));
    CHECK(is_lit(frame, 3, 0));
    CHECK_FALSE(is_lit(frame, 4, 0));
    // Bottom row is the last row of the buffer.
    CHECK(frame.pixels[(3 * 8 + 1) * 3 + 1] == 255);
    CHECK(is_lit(frame, 6, 3));
    CHECK(lit_count(frame) == 5);
}

TEST_CASE("Diagonal lines light one pixel per step", "[raster]") {
    const RasterFrame frame = rasterize({{{0, 0}, {3, 3}}}, 4, 4);
    for (int i = 0; i < 4; ++i) {
        CHECK(is_lit(frame, i, i));
    }
    CHECK(lit_count(frame) == 4);
}

TEST_CASE("Anything off the frame is clipped", "[raster]") {
    const RasterFrame frame = rasterize({{{-5, 1}, {10, 1}}, {{50, 50}}}, 4, 4);
    CHECK(lit_count(frame) == 4);
}

TEST_CASE("Far off-frame segments are trimmed before they are walked", "[raster]") {
    // Billions of pixel steps if walked unclipped.
    const RasterFrame frame = rasterize({{{-2e9, 10}, {2e9, 10}},
                                         {{-3e9, -3e9}, {3e9, 3e9}},
                                         {{5e9, 5e9}, {6e9, -4e9}}},
                                        64, 48);
    for (int x = 0; x < 64; ++x) {
        CHECK(is_lit(frame, x, 10));
    }
    for (int i = 0; i < 48; ++i) {
        CHECK(is_lit(frame, i, i));
    }
    // The horizontal and diagonal lines cross at (10, 10).
    CHECK(lit_count(frame) == 64 + 48 - 1);
}

TEST_CASE("A segment clipped at both ends keeps its slope", "[raster]") {
    const RasterFrame frame = rasterize({{{-10, 5}, {20, 5}}, {{3, -100}, {3, 100}}}, 8, 8);
    CHECK(lit_count(frame) == 8 + 8 - 1);
    CHECK(is_lit(frame, 0, 5));
    CHECK(is_lit(frame, 7, 5));
    CHECK(is_lit(frame, 3, 0));
    CHECK(is_lit(frame, 3, 7));
}
