#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <fstream>
#include <sstream>

#include "core/script_parser.h"
#include "test_support.h"

using namespace tekanim::core;
using tekanim::test::compile;
using tekanim::test::TempDir;
using Catch::Matchers::WithinAbs;

TEST_CASE("Script compiles into a timeline", "[script]") {
    Timeline timeline;
    Error error;
    const std::string script =
        "# plane flies right\n"
        "animation frames 20 fps 12.5\n"
        "canvas 0,0 200,200\n"
        "element plane \"plane.hpgl\" at 5,6 rotate 30 scale 2 fliph\n"
        "element sign \"sign.hpgl\" visible 2..4 blink 2,1,1\n"
        "\n"
        "move plane 0..10 translate 100,0 rotate 90\n"
        "line 0,0 10,10 frames 3..5\n"
        "line 1,1 2,2\n";
    REQUIRE(compile(script, timeline, error));

    CHECK(timeline.frame_count == 20);
    CHECK_THAT(timeline.frame_rate, WithinAbs(12.5, 1e-9));
    CHECK_THAT(timeline.canvas.max_x, WithinAbs(200.0, 1e-9));
    REQUIRE(timeline.elements.size() == 2);
    REQUIRE(timeline.moves.size() == 1);
    REQUIRE(timeline.lines.size() == 2);

    const Element& plane = timeline.elements[0];
    CHECK(plane.id == "plane");
    CHECK(plane.source_path == "plane.hpgl");
    CHECK_THAT(plane.pose.x, WithinAbs(5.0, 1e-9));
    CHECK_THAT(plane.pose.y, WithinAbs(6.0, 1e-9));
    CHECK_THAT(plane.pose.rotation, WithinAbs(30.0, 1e-9));
    CHECK_THAT(plane.pose.scale, WithinAbs(2.0, 1e-9));
    CHECK(plane.flip_horizontal);
    CHECK_FALSE(plane.flip_vertical);

    const Element& sign = timeline.elements[1];
    REQUIRE(sign.visible.has_value());
    CHECK(sign.visible->start == 2);
    CHECK(sign.visible->end == 4);
    REQUIRE(sign.blink.has_value());
    CHECK(sign.blink->on == 2);
    CHECK(sign.blink->off == 1);
    CHECK(sign.blink->phase == 1);

    const Move& move = timeline.moves[0];
    CHECK(move.element_index == 0);
    CHECK(move.line == 7);
    REQUIRE(move.operations.size() == 2);
    // Only parameters the operations change get a target: x and rotation.
    REQUIRE(move.targets.size() == 2);
    CHECK(move.targets[0].parameter == PoseParameter::X);
    CHECK_THAT(move.targets[0].value, WithinAbs(105.0, 1e-9));
    CHECK(move.targets[1].parameter == PoseParameter::Rotation);
    CHECK_THAT(move.targets[1].value, WithinAbs(120.0, 1e-9));

    CHECK(timeline.lines[0].frames.has_value());
    CHECK_FALSE(timeline.lines[1].frames.has_value());
    CHECK(timeline.source_paths() == std::vector<std::string>{"plane.hpgl", "sign.hpgl"});
}

TEST_CASE("Script length can be given as a duration", "[script]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation duration 2 fps 10\n", timeline, error));
    CHECK(timeline.frame_count == 20);
}

TEST_CASE("Script accepts CRLF line endings", "[script]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 5\r\nelement a \"a.hpgl\"\r\nmove a 0..4 scale 2\r\n", timeline, error));
    CHECK(timeline.moves.size() == 1);
}

TEST_CASE("Frame ranges are checked after the whole script is read", "[script]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("element a \"a.hpgl\"\nmove a 0..9 translate 1,1\nanimation frames 10\n", timeline, error));
    CHECK(timeline.frame_count == 10);
}

TEST_CASE("Script syntax errors carry the line number", "[script][errors]") {
    Timeline timeline;
    timeline.frame_count = -7;
    Error error;

    SECTION("unknown statement") {
        REQUIRE_FALSE(compile("animation frames 10\nspin a\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
        CHECK(error.line == 2);
    }

    SECTION("missing animation statement") {
        REQUIRE_FALSE(compile("element a \"a.hpgl\"\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
    }

    SECTION("duplicate animation statement") {
        REQUIRE_FALSE(compile("animation frames 10\nanimation frames 12\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
        CHECK(error.line == 2);
    }

    SECTION("unterminated quote") {
        REQUIRE_FALSE(compile("animation frames 10\n\n# comment\nelement a \"a.hpgl\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
        CHECK(error.line == 4);
    }

    SECTION("move without operations") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\"\nmove a 0..3\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
        CHECK(error.line == 3);
    }

    SECTION("malformed frame range") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\"\nmove a 0-3 scale 2\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
        CHECK(error.line == 3);
    }

    SECTION("unknown move operation") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\"\nmove a 0..3 shear 2\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
    }

    // All-or-nothing: the output timeline is never touched on failure.
    CHECK(timeline.frame_count == -7);
    CHECK(timeline.elements.empty());
}

TEST_CASE("Script reference errors", "[script][errors]") {
    Timeline timeline;
    Error error;

    SECTION("move on an undeclared element") {
        REQUIRE_FALSE(compile("animation frames 10\nmove ghost 0..3 translate 1,1\n", timeline, error));
        CHECK(error.kind == ErrorKind::Declaration);
        CHECK(error.line == 2);
    }

    SECTION("element declared twice") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\"\nelement a \"b.hpgl\"\n", timeline, error));
        CHECK(error.kind == ErrorKind::Declaration);
        CHECK(error.line == 3);
    }

    SECTION("move before the element is declared") {
        REQUIRE_FALSE(compile("animation frames 10\nmove a 0..3 scale 2\nelement a \"a.hpgl\"\n", timeline, error));
        CHECK(error.kind == ErrorKind::Declaration);
    }

    CHECK(is_script_error(error.kind));
}

TEST_CASE("Script range errors", "[script][errors]") {
    Timeline timeline;
    Error error;

    SECTION("range ends before it starts") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\"\nmove a 5..3 scale 2\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
        CHECK(error.line == 3);
    }

    SECTION("negative frame") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\"\nmove a -1..3 scale 2\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
    }

    SECTION("range past the last frame") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\"\nmove a 0..10 scale 2\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
        CHECK(error.line == 3);
    }

    SECTION("line visibility past the last frame") {
        REQUIRE_FALSE(compile("animation frames 10\nline 0,0 1,1 frames 8..12\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
        CHECK(error.line == 2);
    }

    SECTION("element visibility past the last frame") {
        REQUIRE_FALSE(compile("animation frames 4\nelement a \"a.hpgl\" visible 0..4\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
    }

    SECTION("zero frames") {
        REQUIRE_FALSE(compile("animation frames 0\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
    }

    SECTION("non-positive scale") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\" scale 0\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
    }

    SECTION("blink never on") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\" blink 0,3\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
    }

    SECTION("duration too long to count in frames") {
        REQUIRE_FALSE(compile("# huge\nanimation duration 1e12 fps 25\n", timeline, error));
        CHECK(error.kind == ErrorKind::Range);
        CHECK(error.line == 2);
    }
}

TEST_CASE("Long durations still fit a frame count", "[script]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation duration 80000000 fps 25\n", timeline, error));
    CHECK(timeline.frame_count == 2000000000);
}

TEST_CASE("Blink phase is reduced to one period", "[script]") {
    Timeline timeline;
    Error error;
    REQUIRE(compile("animation frames 10\n"
                    "element a \"a.hpgl\" blink 2,1,2147483647\n"
                    "element b \"a.hpgl\" blink 2147483647,2147483647,2147483646\n",
                    timeline, error));
    const Blink& a = *timeline.elements[0].blink;
    CHECK(a.phase == 1);
    CHECK(a.visible_at(0));
    CHECK_FALSE(a.visible_at(1));
    CHECK(a.visible_at(2147483647 - 1));

    const Blink& b = *timeline.elements[1].blink;
    CHECK(b.phase == 2147483646);
    CHECK(b.visible_at(0));
    CHECK_FALSE(b.visible_at(1));
    CHECK_FALSE(b.visible_at(2147483647));
}

TEST_CASE("Rose parameters parse by prefix", "[script]") {
    Timeline timeline;
    Error error;

    SECTION("every parameter") {
        REQUIRE(compile("animation frames 10\n"
                        "element a \"a.hpgl\" rose k3,nu0.5,sx40,sy20,r90,dt0.25\n"
                        "element b \"a.hpgl\"\n",
                        timeline, error));
        REQUIRE(timeline.elements[0].rose.has_value());
        const Rose& rose = *timeline.elements[0].rose;
        CHECK_THAT(rose.k, WithinAbs(3.0, 1e-12));
        CHECK_THAT(rose.nu, WithinAbs(0.5, 1e-12));
        CHECK_THAT(rose.stretch_x, WithinAbs(40.0, 1e-12));
        CHECK_THAT(rose.stretch_y, WithinAbs(20.0, 1e-12));
        CHECK_THAT(rose.rotate, WithinAbs(90.0, 1e-12));
        CHECK_THAT(rose.t_offset, WithinAbs(0.25, 1e-12));
        CHECK_FALSE(timeline.elements[1].rose.has_value());
    }

    SECTION("defaults for parameters left out") {
        REQUIRE(compile("animation frames 10\nelement a \"a.hpgl\" rose sx5\n", timeline, error));
        const Rose& rose = *timeline.elements[0].rose;
        CHECK(rose.k == 1.0);
        CHECK(rose.nu == 1.0);
        CHECK(rose.stretch_x == 5.0);
        CHECK(rose.stretch_y == 1.0);
    }

    SECTION("unknown parameter") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\" rose q2\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
        CHECK(error.line == 2);
    }

    SECTION("missing number") {
        REQUIRE_FALSE(compile("animation frames 10\nelement a \"a.hpgl\" rose k3,sx\n", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
    }
}

TEST_CASE("Script sources are checked for existence", "[script][errors]") {
    TempDir dir("script");
    {
        std::ofstream present(dir.path() / "present.hpgl");
        present << "PU0,0;PD10,10;\n";
    }
    const fs::path script = dir.path() / "scene.anim";

    SECTION("existing sources resolve against the script directory") {
        {
            std::ofstream out(script);
            out << "animation frames 3\nelement a \"present.hpgl\"\n";
        }
        Timeline timeline;
        Error error;
        REQUIRE(parse_script_file(script, timeline, error));
        CHECK(timeline.elements[0].source_path == (dir.path() / "present.hpgl").lexically_normal().string());
    }

    SECTION("a missing source fails on the element line") {
        {
            std::ofstream out(script);
            out << "animation frames 3\nelement a \"present.hpgl\"\nelement b \"missing.hpgl\"\n";
        }
        Timeline timeline;
        Error error;
        REQUIRE_FALSE(parse_script_file(script, timeline, error));
        CHECK(error.kind == ErrorKind::Collaborator);
        CHECK(error.line == 3);
    }

    SECTION("an unreadable script is a parse error") {
        Timeline timeline;
        Error error;
        REQUIRE_FALSE(parse_script_file(dir.path() / "nope.anim", timeline, error));
        CHECK(error.kind == ErrorKind::Parse);
    }
}

TEST_CASE("Errors format with kind, line and frame", "[errors]") {
    Error error;
    fail(error, ErrorKind::Range, "bad range", 4);
    CHECK(format_error(error) == "RangeError at line 4: bad range");
    error.frame = 12;
    CHECK(format_error(error) == "RangeError at line 4 at frame 12: bad range");
}

TEST_CASE("Script errors name the script", "[errors]") {
    Error error;
    fail(error, ErrorKind::Parse, "unknown statement 'fly'", 3);
    CHECK(format_error(error, "plane.anim") == "plane.anim: ParseError at line 3: unknown statement 'fly'");
    fail(error, ErrorKind::Declaration, "element 'a' is already declared", 5);
    CHECK(format_error(error, "plane.anim").starts_with("plane.anim: DeclarationError"));

    fail(error, ErrorKind::Output, "disk full");
    CHECK(format_error(error, "plane.anim") == "OutputError: disk full");
    fail(error, ErrorKind::Collaborator, "vector source not found", 2);
    CHECK(format_error(error, "plane.anim") == "CollaboratorError at line 2: vector source not found");
}
