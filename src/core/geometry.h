#pragma once

#include <vector>

namespace tekanim::core {

struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point& other) const = default;
};

// A stroke is a sequence of points joined by straight lines. A single-point
// stroke is drawn as a dot.
using Stroke = std::vector<Point>;
using Strokes = std::vector<Stroke>;

struct Bounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
    bool valid = false;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    Point center() const { return {(min_x + max_x) / 2.0, (min_y + max_y) / 2.0}; }
};

Bounds make_bounds(double min_x, double min_y, double max_x, double max_y);

// 2D affine transform: x' = a*x + c*y + tx, y' = b*x + d*y + ty.
struct Affine {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 1.0;
    double tx = 0.0;
    double ty = 0.0;

    static Affine translation(double dx, double dy);
    static Affine scaling(double sx, double sy);
    static Affine rotation_degrees(double degrees);
    // Applies `inner` around `pivot` instead of around the origin.
    static Affine about(const Affine& inner, Point pivot);

    // Returns the transform that applies `rhs` first, then this.
    Affine operator*(const Affine& rhs) const;
    Point apply(Point p) const;
};

Bounds stroke_bounds(const Strokes& strokes);
Strokes transform_strokes(const Strokes& strokes, const Affine& transform);

// Scales `source` uniformly so that its most constrained dimension fills `box`,
// centred along the other dimension.
Affine fit_to_box(const Bounds& source, const Bounds& box);

} // namespace tekanim::core
