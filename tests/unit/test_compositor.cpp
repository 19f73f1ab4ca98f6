#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/compositor.h"
#include "test_support.h"

using namespace tekanim::core;
using tekanim::test::compile;
using tekanim::test::squares_for;
using Catch::Matchers::WithinAbs;

namespace {

Scene compose_or_fail(const Timeline& timeline, const SourceLibrary& sources, int frame) {
    Scene scene;
    Error error;
    REQUIRE(compose(timeline, sources, frame, scene, error));
    return scene;
}

Pose pose_of(const Timeline& timeline, const std::string& id, int frame) {
    for (size_t i = 0; i < timeline.elements.size(); ++i) {
        if (timeline.elements[i].id == id) {
            return evaluate_pose(timeline, i, frame);
        }
    }
    FAIL("no element " << id);
    return {};
}

} // namespace

TEST_CASE("Plane moves linearly and holds its target", "[compositor]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 20\n"
                    "canvas 0,0 200,200\n"
                    "element plane \"plane.hpgl\"\n"
                    "move plane 0..10 translate 100,0\n",
                    timeline, error));
    const SourceLibrary sources = squares_for(timeline);

    const Scene start = compose_or_fail(timeline, sources, 0);
    const Scene middle = compose_or_fail(timeline, sources, 5);
    const Scene end = compose_or_fail(timeline, sources, 10);
    const Scene after = compose_or_fail(timeline, sources, 15);

    REQUIRE(start.placements.size() == 1);
    CHECK_THAT(start.placements[0].pose.x, WithinAbs(0.0, 1e-9));
    CHECK_THAT(middle.placements[0].pose.x, WithinAbs(50.0, 1e-9));
    CHECK_THAT(end.placements[0].pose.x, WithinAbs(100.0, 1e-9));
    CHECK_THAT(after.placements[0].pose.x, WithinAbs(100.0, 1e-9));
    CHECK_THAT(after.placements[0].pose.y, WithinAbs(0.0, 1e-9));

    // The unit square is fitted to the 200x200 canvas, then translated.
    REQUIRE(middle.strokes.size() == 1);
    REQUIRE(middle.strokes[0].size() == 5);
    CHECK_THAT(start.strokes[0][0].x, WithinAbs(0.0, 1e-9));
    CHECK_THAT(middle.strokes[0][0].x, WithinAbs(50.0, 1e-9));
    CHECK_THAT(middle.strokes[0][2].x, WithinAbs(250.0, 1e-9));
    CHECK_THAT(middle.strokes[0][2].y, WithinAbs(200.0, 1e-9));
    CHECK_THAT(after.strokes[0][0].x, WithinAbs(100.0, 1e-9));
}

TEST_CASE("Composition is deterministic and order independent", "[compositor]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 30\n"
                    "canvas 0,0 200,200\n"
                    "element a \"a.hpgl\" at 10,10\n"
                    "element b \"b.hpgl\" rotate 45\n"
                    "move a 0..20 translate 50,25 rotate 180\n"
                    "move b 5..25 scale 0.5\n"
                    "move a 10..29 translate -20,0\n",
                    timeline, error));
    const SourceLibrary sources = squares_for(timeline);

    std::vector<Scene> forward;
    for (int frame = 0; frame < timeline.frame_count; ++frame) {
        forward.push_back(compose_or_fail(timeline, sources, frame));
    }
    for (int frame = timeline.frame_count - 1; frame >= 0; --frame) {
        const Scene again = compose_or_fail(timeline, sources, frame);
        const Scene& first = forward[static_cast<size_t>(frame)];
        CHECK(again.frame_index == frame);
        REQUIRE(again.strokes.size() == first.strokes.size());
        for (size_t s = 0; s < again.strokes.size(); ++s) {
            CHECK(again.strokes[s] == first.strokes[s]);
        }
    }
}

TEST_CASE("Overlapping moves resolve per parameter", "[compositor]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 20\n"
                    "element a \"a.hpgl\"\n"
                    "element b \"b.hpgl\"\n"
                    "move a 0..10 translate 100,0\n"
                    "move a 5..15 translate 0,50\n"
                    "move b 0..10 translate 100,0\n"
                    "move b 5..15 translate -100,0\n",
                    timeline, error));

    SECTION("independent parameters combine") {
        const Pose mid = pose_of(timeline, "a", 10);
        CHECK_THAT(mid.x, WithinAbs(100.0, 1e-9));
        CHECK_THAT(mid.y, WithinAbs(25.0, 1e-9));
        const Pose done = pose_of(timeline, "a", 15);
        CHECK_THAT(done.x, WithinAbs(100.0, 1e-9));
        CHECK_THAT(done.y, WithinAbs(50.0, 1e-9));
    }

    SECTION("the last declared move wins on a shared parameter") {
        // The second move starts from x = 50, the value at frame 5.
        CHECK_THAT(pose_of(timeline, "b", 5).x, WithinAbs(50.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "b", 10).x, WithinAbs(25.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "b", 15).x, WithinAbs(-50.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "b", 19).x, WithinAbs(-50.0, 1e-9));
    }
}

TEST_CASE("Moves declared out of time order still play in time order", "[compositor]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 30\n"
                    "element a \"a.hpgl\"\n"
                    "element b \"b.hpgl\"\n"
                    "move a 10..20 translate 100,0\n"
                    "move a 0..5 translate 50,0\n"
                    "move b 20..29 rotate 30\n"
                    "move b 10..20 rotate 30\n"
                    "move b 0..10 rotate 30\n",
                    timeline, error));

    SECTION("a later declared earlier move is not undone by the active one") {
        CHECK_THAT(pose_of(timeline, "a", 3).x, WithinAbs(30.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "a", 10).x, WithinAbs(50.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "a", 15).x, WithinAbs(100.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "a", 20).x, WithinAbs(150.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "a", 29).x, WithinAbs(150.0, 1e-9));
    }

    SECTION("consecutive moves accumulate whatever their declaration order") {
        CHECK_THAT(pose_of(timeline, "b", 5).rotation, WithinAbs(15.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "b", 15).rotation, WithinAbs(45.0, 1e-9));
        CHECK_THAT(pose_of(timeline, "b", 29).rotation, WithinAbs(90.0, 1e-9));
    }
}

TEST_CASE("Fold order follows time, then declaration", "[timeline]") {
    auto move_on = [](size_t element, int start, int end) {
        Move move;
        move.element_index = element;
        move.range = {.start = start, .end = end};
        return move;
    };

    SECTION("only moves that finish before another starts are reordered") {
        // The first move must follow the last; the middle one overlaps both.
        const std::vector<Move> moves = {move_on(0, 5, 6), move_on(0, 1, 10), move_on(0, 0, 2)};
        CHECK(move_fold_order(moves) == std::vector<size_t>{1, 2, 0});
    }

    SECTION("moves on other elements do not constrain each other") {
        const std::vector<Move> moves = {move_on(0, 10, 20), move_on(1, 0, 5)};
        CHECK(move_fold_order(moves) == std::vector<size_t>{0, 1});
    }

    SECTION("zero-length moves on one frame keep declaration order") {
        const std::vector<Move> moves = {move_on(0, 4, 4), move_on(0, 4, 4), move_on(0, 0, 4)};
        CHECK(move_fold_order(moves) == std::vector<size_t>{2, 0, 1});
    }

    CHECK(move_precedes({.start = 0, .end = 5}, {.start = 5, .end = 9}));
    CHECK_FALSE(move_precedes({.start = 5, .end = 9}, {.start = 0, .end = 5}));
    CHECK_FALSE(move_precedes({.start = 3, .end = 3}, {.start = 3, .end = 3}));
}

TEST_CASE("A rose nudges the element around its pose", "[compositor]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 4 fps 2\n"
                    "element a \"a.hpgl\" at 100,100 rose k0,nu3.141592653589793,sx10,sy20\n"
                    "element b \"b.hpgl\" at 100,100 rose k0,nu3.141592653589793,sx10,sy20,dt0.5\n"
                    "element c \"c.hpgl\" rose k0,nu0,sx10,r90\n"
                    "move a 0..2 translate 50,0\n",
                    timeline, error));

    // Frames are 0.5 s apart, so the curve turns a quarter per frame.
    const Pose a0 = pose_of(timeline, "a", 0);
    CHECK_THAT(a0.x, WithinAbs(110.0, 1e-9));
    CHECK_THAT(a0.y, WithinAbs(100.0, 1e-9));
    const Pose a1 = pose_of(timeline, "a", 1);
    CHECK_THAT(a1.x, WithinAbs(125.0, 1e-9));
    CHECK_THAT(a1.y, WithinAbs(120.0, 1e-9));
    const Pose a2 = pose_of(timeline, "a", 2);
    CHECK_THAT(a2.x, WithinAbs(140.0, 1e-9));
    CHECK_THAT(a2.y, WithinAbs(100.0, 1e-9));

    // The time offset starts the curve a quarter turn ahead.
    const Pose b0 = pose_of(timeline, "b", 0);
    CHECK_THAT(b0.x, WithinAbs(100.0, 1e-9));
    CHECK_THAT(b0.y, WithinAbs(120.0, 1e-9));

    // Rotating the curve by 90 degrees turns its x stretch into y.
    const Pose c = pose_of(timeline, "c", 3);
    CHECK_THAT(c.x, WithinAbs(0.0, 1e-9));
    CHECK_THAT(c.y, WithinAbs(10.0, 1e-9));
}

TEST_CASE("Rotation and scale interpolate linearly", "[compositor]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 11\n"
                    "element a \"a.hpgl\" rotate 10 scale 2\n"
                    "move a 0..10 rotate 90 scale 3\n",
                    timeline, error));
    const Pose mid = pose_of(timeline, "a", 5);
    CHECK_THAT(mid.rotation, WithinAbs(55.0, 1e-9));
    CHECK_THAT(mid.scale, WithinAbs(4.0, 1e-9));
    const Pose end = pose_of(timeline, "a", 10);
    CHECK_THAT(end.rotation, WithinAbs(100.0, 1e-9));
    CHECK_THAT(end.scale, WithinAbs(6.0, 1e-9));
}

TEST_CASE("Visibility, blinking and lines", "[compositor]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 10\n"
                    "element shown \"a.hpgl\" visible 2..4\n"
                    "element flashing \"a.hpgl\" blink 2,1\n"
                    "line 0,0 10,10 frames 3..5\n"
                    "line 1,1 2,2\n",
                    timeline, error));
    const SourceLibrary sources = squares_for(timeline);

    auto ids_at = [&](int frame) {
        std::vector<std::string> ids;
        for (const auto& placement : compose_or_fail(timeline, sources, frame).placements) {
            ids.push_back(placement.element_id);
        }
        return ids;
    };

    CHECK(ids_at(0) == std::vector<std::string>{"flashing"});
    CHECK(ids_at(2) == std::vector<std::string>{"shown"});
    CHECK(ids_at(3) == std::vector<std::string>{"shown", "flashing"});
    CHECK(ids_at(4) == std::vector<std::string>{"shown", "flashing"});
    CHECK(ids_at(5).empty());

    // Element strokes first, then lines in declaration order.
    const Scene frame3 = compose_or_fail(timeline, sources, 3);
    REQUIRE(frame3.strokes.size() == 4);
    CHECK(frame3.strokes[2] == Stroke{{0, 0}, {10, 10}});
    CHECK(frame3.strokes[3] == Stroke{{1, 1}, {2, 2}});

    const Scene frame6 = compose_or_fail(timeline, sources, 6);
    REQUIRE(frame6.strokes.size() == 2);
    CHECK(frame6.strokes[1] == Stroke{{1, 1}, {2, 2}});
}

TEST_CASE("Blink phase shifts the cycle", "[timeline]") {
    Blink blink{.on = 2, .off = 1, .phase = 1};
    CHECK(blink.visible_at(0));
    CHECK_FALSE(blink.visible_at(1));
    CHECK(blink.visible_at(2));
    CHECK(blink.visible_at(3));
    CHECK_FALSE(blink.visible_at(4));
}

TEST_CASE("Move fraction is clamped", "[timeline]") {
    const FrameRange range{.start = 4, .end = 8};
    CHECK(move_fraction(range, 0) == 0.0);
    CHECK(move_fraction(range, 4) == 0.0);
    CHECK_THAT(move_fraction(range, 6), WithinAbs(0.5, 1e-12));
    CHECK(move_fraction(range, 8) == 1.0);
    CHECK(move_fraction(range, 100) == 1.0);
    CHECK(move_fraction({.start = 3, .end = 3}, 3) == 1.0);
}

TEST_CASE("Compose rejects bad frames and missing sources", "[compositor][errors]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 5\nelement a \"a.hpgl\"\n", timeline, error));
    Scene scene;

    SECTION("frame outside the animation") {
        const SourceLibrary sources = squares_for(timeline);
        REQUIRE_FALSE(compose(timeline, sources, 5, scene, error));
        CHECK(error.kind == ErrorKind::Range);
        REQUIRE_FALSE(compose(timeline, sources, -1, scene, error));
        CHECK(error.kind == ErrorKind::Range);
    }

    SECTION("source never loaded") {
        const SourceLibrary empty;
        REQUIRE_FALSE(compose(timeline, empty, 0, scene, error));
        CHECK(error.kind == ErrorKind::Collaborator);
        CHECK(error.line == 2);
    }
}

TEST_CASE("Element matrix flips about the drawing centre", "[compositor]") {
    Element element;
    element.flip_horizontal = true;
    const Bounds source = make_bounds(0, 0, 10, 10);
    const Bounds canvas = make_bounds(0, 0, 100, 100);
    const Affine m = element_matrix(element, Pose{}, source, canvas);

    const Point left = m.apply({0, 0});
    CHECK_THAT(left.x, WithinAbs(100.0, 1e-9));
    CHECK_THAT(left.y, WithinAbs(0.0, 1e-9));
    const Point centre = m.apply({5, 5});
    CHECK_THAT(centre.x, WithinAbs(50.0, 1e-9));
    CHECK_THAT(centre.y, WithinAbs(50.0, 1e-9));
}
