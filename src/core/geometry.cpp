#include "geometry.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace tekanim::core {

Bounds make_bounds(double min_x, double min_y, double max_x, double max_y) {
    return {.min_x = min_x, .min_y = min_y, .max_x = max_x, .max_y = max_y, .valid = true};
}

Affine Affine::translation(double dx, double dy) {
    Affine t;
    t.tx = dx;
    t.ty = dy;
    return t;
}

Affine Affine::scaling(double sx, double sy) {
    Affine t;
    t.a = sx;
    t.d = sy;
    return t;
}

Affine Affine::rotation_degrees(double degrees) {
    const double theta = degrees * std::numbers::pi / 180.0;
    const double sin_theta = std::sin(theta);
    const double cos_theta = std::cos(theta);
    Affine t;
    t.a = cos_theta;
    t.b = sin_theta;
    t.c = -sin_theta;
    t.d = cos_theta;
    return t;
}

Affine Affine::about(const Affine& inner, Point pivot) {
    return translation(pivot.x, pivot.y) * inner * translation(-pivot.x, -pivot.y);
}

Affine Affine::operator*(const Affine& rhs) const {
    Affine out;
    out.a = a * rhs.a + c * rhs.b;
    out.b = b * rhs.a + d * rhs.b;
    out.c = a * rhs.c + c * rhs.d;
    out.d = b * rhs.c + d * rhs.d;
    out.tx = a * rhs.tx + c * rhs.ty + tx;
    out.ty = b * rhs.tx + d * rhs.ty + ty;
    return out;
}

Point Affine::apply(Point p) const {
    return {a * p.x + c * p.y + tx, b * p.x + d * p.y + ty};
}

Bounds stroke_bounds(const Strokes& strokes) {
    Bounds bounds;
    for (const auto& stroke : strokes) {
        for (const auto& p : stroke) {
            if (!bounds.valid) {
                bounds = make_bounds(p.x, p.y, p.x, p.y);
                continue;
            }
            bounds.min_x = std::min(bounds.min_x, p.x);
            bounds.min_y = std::min(bounds.min_y, p.y);
            bounds.max_x = std::max(bounds.max_x, p.x);
            bounds.max_y = std::max(bounds.max_y, p.y);
        }
    }
    return bounds;
}

Strokes transform_strokes(const Strokes& strokes, const Affine& transform) {
    Strokes out;
    out.reserve(strokes.size());
    for (const auto& stroke : strokes) {
        Stroke transformed;
        transformed.reserve(stroke.size());
        for (const auto& p : stroke) {
            transformed.push_back(transform.apply(p));
        }
        out.push_back(std::move(transformed));
    }
    return out;
}

Affine fit_to_box(const Bounds& source, const Bounds& box) {
    if (!source.valid || !box.valid) {
        return {};
    }

    const double box_dx = box.width();
    const double box_dy = box.height();
    const double source_dx = source.width();
    const double source_dy = source.height();

    // A single point or an empty drawing keeps its size and lands in the middle.
    if (source_dx <= 0.0 && source_dy <= 0.0) {
        const Point from = source.center();
        const Point to = box.center();
        return Affine::translation(to.x - from.x, to.y - from.y);
    }

    // box_dx / box_dy > source_dx / source_dy means the drawing is taller
    // than the box, so height is the constrained dimension.
    double scale = 0.0;
    double shift_x = 0.0;
    double shift_y = 0.0;
    if (source_dy > 0.0 && std::abs(box_dx * source_dy / box_dy) > std::abs(source_dx)) {
        scale = box_dy / source_dy;
        shift_x = box.min_x + (box_dx - scale * source_dx) / 2.0 - scale * source.min_x;
        shift_y = box.min_y - scale * source.min_y;
    } else {
        scale = box_dx / source_dx;
        shift_x = box.min_x - scale * source.min_x;
        shift_y = box.min_y + (box_dy - scale * source_dy) / 2.0 - scale * source.min_y;
    }

    Affine t = Affine::scaling(scale, scale);
    t.tx = shift_x;
    t.ty = shift_y;
    return t;
}

} // namespace tekanim::core
