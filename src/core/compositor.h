#pragma once

#include <string>
#include <vector>

#include "error.h"
#include "geometry.h"
#include "timeline.h"
#include "vector_source.h"

namespace tekanim::core {

// Where one element is drawn in a frame.
struct Placement {
    std::string element_id;
    Pose pose;
    Affine matrix;
};

// Drawable primitives of one frame in canvas coordinates: element strokes in
// declaration order, then visible lines.
struct Scene {
    int frame_index = 0;
    std::vector<Placement> placements;
    Strokes strokes;
};

// translate * scale * rotate * flip * fit-to-canvas, with scale, rotation and
// flip taken about the centre of the fitted drawing.
Affine element_matrix(const Element& element, const Pose& pose, const Bounds& source_bounds,
                      const Bounds& canvas);

// Pure in (timeline, sources, frame_index).
bool compose(const Timeline& timeline, const SourceLibrary& sources, int frame_index, Scene& out,
             Error& error);

} // namespace tekanim::core
