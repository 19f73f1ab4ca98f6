#include "compositor.h"

#include <utility>

#include "cli_parse.h"

namespace tekanim::core {

Affine element_matrix(const Element& element, const Pose& pose, const Bounds& source_bounds,
                      const Bounds& canvas) {
    const Affine fit = fit_to_box(source_bounds, canvas);
    const Point pivot = fit.apply(source_bounds.center());

    const Affine flip = Affine::scaling(element.flip_horizontal ? -1.0 : 1.0,
                                        element.flip_vertical ? -1.0 : 1.0);
    return Affine::translation(pose.x, pose.y)
        * Affine::about(Affine::scaling(pose.scale, pose.scale), pivot)
        * Affine::about(Affine::rotation_degrees(pose.rotation), pivot)
        * Affine::about(flip, pivot)
        * fit;
}

bool compose(const Timeline& timeline, const SourceLibrary& sources, int frame_index, Scene& out,
             Error& error) {
    if (frame_index < 0 || frame_index >= timeline.frame_count) {
        return fail(error, ErrorKind::Range,
                    "frame " + std::to_string(frame_index) + " is outside 0.."
                        + std::to_string(timeline.frame_count - 1));
    }

    Scene scene;
    scene.frame_index = frame_index;
    for (size_t i = 0; i < timeline.elements.size(); ++i) {
        const Element& element = timeline.elements[i];
        if (!element.visible_at(frame_index)) {
            continue;
        }
        const VectorSource* source = sources.find(element.source_path);
        if (source == nullptr) {
            return fail(error, ErrorKind::Collaborator,
                        "vector source " + to_quoted(element.source_path) + " is not loaded",
                        element.line);
        }

        Placement placement;
        placement.element_id = element.id;
        placement.pose = evaluate_pose(timeline, i, frame_index);
        placement.matrix = element_matrix(element, placement.pose, source->bounds, timeline.canvas);

        VectorSource placed = source->transformed(placement.matrix);
        for (auto& stroke : placed.strokes) {
            scene.strokes.push_back(std::move(stroke));
        }
        scene.placements.push_back(std::move(placement));
    }

    for (const Line& line : timeline.lines) {
        if (line.frames && !line.frames->contains(frame_index)) {
            continue;
        }
        scene.strokes.push_back({line.from, line.to});
    }

    out = std::move(scene);
    return true;
}

} // namespace tekanim::core
