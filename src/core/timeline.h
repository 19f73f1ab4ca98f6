#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "geometry.h"

namespace tekanim::core {

constexpr int k_default_frame_rate = 25;
constexpr double k_default_canvas_min_x = 0.0;
constexpr double k_default_canvas_min_y = 0.0;
constexpr double k_default_canvas_max_x = 1000.0;
constexpr double k_default_canvas_max_y = 779.0;

enum class PoseParameter { X, Y, Rotation, Scale };

constexpr std::array<PoseParameter, 4> k_pose_parameters = {
    PoseParameter::X,
    PoseParameter::Y,
    PoseParameter::Rotation,
    PoseParameter::Scale,
};

// Position offset, rotation in degrees anticlockwise, uniform scale.
struct Pose {
    double x = 0.0;
    double y = 0.0;
    double rotation = 0.0;
    double scale = 1.0;

    double get(PoseParameter parameter) const;
    void set(PoseParameter parameter, double value);
};

// Inclusive on both ends.
struct FrameRange {
    int start = 0;
    int end = 0;

    bool contains(int frame) const { return frame >= start && frame <= end; }
};

// Visible for `on` frames, hidden for `off` frames, repeating; `phase`
// offsets the cycle at frame 0.
struct Blink {
    int on = 1;
    int off = 0;
    int phase = 0;

    bool visible_at(int frame) const;
};

// Position offset that traces a linearly transformed rose curve over time
// (seconds): r = cos(k(t + dt)), theta = nu(t + dt), stretched by (sx, sy),
// then rotated by `rotate` degrees.
struct Rose {
    double k = 1.0;
    double nu = 1.0;
    double stretch_x = 1.0;
    double stretch_y = 1.0;
    double rotate = 0.0;
    double t_offset = 0.0;

    Point offset_at(double seconds) const;
};

struct Element {
    std::string id;
    std::string source_path;
    Pose pose;
    bool flip_horizontal = false;
    bool flip_vertical = false;
    std::optional<FrameRange> visible;
    std::optional<Blink> blink;
    std::optional<Rose> rose;
    int line = 0;

    bool visible_at(int frame) const;
};

enum class TransformOp { Translate, Rotate, Scale };

// Relative change reached at the end of a move: translate by (a, b), rotate
// by a degrees, scale by factor a.
struct Operation {
    TransformOp op = TransformOp::Translate;
    double a = 0.0;
    double b = 0.0;
};

// Absolute value a parameter reaches at the end of a move.
struct Target {
    PoseParameter parameter = PoseParameter::X;
    double value = 0.0;
};

struct Move {
    std::string element_id;
    size_t element_index = 0;
    FrameRange range;
    std::vector<Operation> operations;
    std::vector<Target> targets; // filled by resolve_move_targets
    int line = 0;
};

struct Line {
    Point from;
    Point to;
    std::optional<FrameRange> frames;
    int line = 0;
};

struct Timeline {
    std::vector<Element> elements;
    std::vector<Move> moves;
    // Indices into `moves` in fold order, filled by resolve_move_targets.
    std::vector<size_t> move_order;
    std::vector<Line> lines;
    int frame_count = 0;
    double frame_rate = k_default_frame_rate;
    Bounds canvas = make_bounds(k_default_canvas_min_x, k_default_canvas_min_y,
                                k_default_canvas_max_x, k_default_canvas_max_y);

    const Element* find_element(const std::string& id) const;
    // Distinct source paths in declaration order.
    std::vector<std::string> source_paths() const;
};

// Progress of `range` at `frame`, clamped to [0, 1].
double move_fraction(const FrameRange& range, int frame);

// True when `first` is over by the time `second` starts, so `second` must
// fold after it whatever the declaration order.
bool move_precedes(const FrameRange& first, const FrameRange& second);

// Moves sorted so that a move folds after every move that precedes it in
// time. Moves with no such constraint between them keep declaration order.
std::vector<size_t> move_fold_order(const std::vector<Move>& moves);

// Folds the first `move_limit` moves of `timeline.move_order` over the
// element's declared value.
double evaluate_parameter(const Timeline& timeline, size_t element_index, PoseParameter parameter,
                          int frame, size_t move_limit);

// Folded pose plus the element's rose offset at `frame`.
Pose evaluate_pose(const Timeline& timeline, size_t element_index, int frame);

// Fixes the fold order, then turns each move's relative operations into
// absolute targets, measured from the value the parameter has at the move's
// start frame. Only parameters an operation actually changes get a target.
void resolve_move_targets(Timeline& timeline);

} // namespace tekanim::core
