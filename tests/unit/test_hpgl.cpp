#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <fstream>

#include "core/hpgl.h"
#include "core/vector_source.h"
#include "test_support.h"

using namespace tekanim::core;
using tekanim::test::TempDir;
using Catch::Matchers::WithinAbs;

TEST_CASE("Pen up and pen down build strokes", "[hpgl]") {
    const Strokes strokes = parse_hpgl_text("IN;SP1;PU0,0;PD10,0,10,10;PU;PU20,20;PD30,20;\n");
    REQUIRE(strokes.size() == 2);
    CHECK(strokes[0] == Stroke{{0, 0}, {10, 0}, {10, 10}});
    CHECK(strokes[1] == Stroke{{20, 20}, {30, 20}});
}

TEST_CASE("PA follows the current pen state", "[hpgl]") {
    const Strokes strokes = parse_hpgl_text("PU5,5;PA7,7;PD;PA9,9,11,9;");
    REQUIRE(strokes.size() == 1);
    CHECK(strokes[0] == Stroke{{7, 7}, {9, 9}, {11, 9}});
}

TEST_CASE("PR offsets accumulate", "[hpgl]") {
    const Strokes strokes = parse_hpgl_text("PU0,0;PD;PR10,0,0,10;");
    REQUIRE(strokes.size() == 1);
    CHECK(strokes[0] == Stroke{{0, 0}, {10, 0}, {10, 10}});
}

TEST_CASE("AA draws an arc in small steps", "[hpgl]") {
    const Strokes strokes = parse_hpgl_text("PU10,0;PD;AA0,0,90;");
    REQUIRE(strokes.size() == 1);
    // 90 degrees in 4 degree steps: 22 intermediate points and the end point.
    REQUIRE(strokes[0].size() == 24);
    const Point end = strokes[0].back();
    CHECK_THAT(end.x, WithinAbs(0.0, 1e-9));
    CHECK_THAT(end.y, WithinAbs(10.0, 1e-9));
    for (const Point& p : strokes[0]) {
        CHECK_THAT(p.x * p.x + p.y * p.y, WithinAbs(100.0, 1e-6));
    }
}

TEST_CASE("Unsupported statements are skipped", "[hpgl]") {
    const Strokes strokes = parse_hpgl_text("LBHELLO;PU1,1;PDx,2;PD2,2;");
    REQUIRE(strokes.size() == 1);
    CHECK(strokes[0] == Stroke{{1, 1}, {2, 2}});
}

TEST_CASE("Vector sources load from HPGL files", "[hpgl][source]") {
    TempDir dir("hpgl");
    const fs::path path = dir.path() / "box.hpgl";
    {
        std::ofstream out(path);
        out << "PU0,0;\nPD40,0,40,20,0,20,0,0;\nPU;\n";
    }

    VectorSource source;
    Error error;
    REQUIRE(load_vector_source(path, source, error));
    REQUIRE(source.strokes.size() == 1);
    CHECK(source.bounds.max_x == 40.0);
    CHECK(source.bounds.max_y == 20.0);

    SourceLibrary library;
    REQUIRE(library.load({path.string(), path.string()}, error));
    CHECK(library.size() == 1);
    CHECK(library.find(path.string()) != nullptr);
    CHECK(library.find("other.hpgl") == nullptr);

    REQUIRE_FALSE(library.load({(dir.path() / "missing.hpgl").string()}, error));
    CHECK(error.kind == ErrorKind::Collaborator);
}
