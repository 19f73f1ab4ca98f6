#include "timeline.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <unordered_set>

namespace tekanim::core {

double Pose::get(PoseParameter parameter) const {
    switch (parameter) {
    case PoseParameter::X:
        return x;
    case PoseParameter::Y:
        return y;
    case PoseParameter::Rotation:
        return rotation;
    case PoseParameter::Scale:
        return scale;
    }
    return 0.0;
}

void Pose::set(PoseParameter parameter, double value) {
    switch (parameter) {
    case PoseParameter::X:
        x = value;
        break;
    case PoseParameter::Y:
        y = value;
        break;
    case PoseParameter::Rotation:
        rotation = value;
        break;
    case PoseParameter::Scale:
        scale = value;
        break;
    }
}

bool Blink::visible_at(int frame) const {
    const long long period = static_cast<long long>(on) + off;
    if (period <= 0) {
        return true;
    }
    return (static_cast<long long>(frame) + phase) % period < on;
}

Point Rose::offset_at(double seconds) const {
    const double t = seconds + t_offset;
    const double r = std::cos(k * t);
    const double theta = nu * t;
    const double dx = r * std::cos(theta) * stretch_x;
    const double dy = r * std::sin(theta) * stretch_y;
    const double radians = rotate * std::numbers::pi / 180.0;
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    return {dx * c - dy * s, dx * s + dy * c};
}

bool Element::visible_at(int frame) const {
    if (visible && !visible->contains(frame)) {
        return false;
    }
    return !blink || blink->visible_at(frame);
}

const Element* Timeline::find_element(const std::string& id) const {
    auto it = std::ranges::find_if(elements, [&](const Element& e) { return e.id == id; });
    if (it == elements.end()) {
        return nullptr;
    }
    return &*it;
}

std::vector<std::string> Timeline::source_paths() const {
    std::vector<std::string> paths;
    std::unordered_set<std::string> seen;
    for (const auto& element : elements) {
        if (seen.insert(element.source_path).second) {
            paths.push_back(element.source_path);
        }
    }
    return paths;
}

double move_fraction(const FrameRange& range, int frame) {
    if (frame < range.start) {
        return 0.0;
    }
    if (frame >= range.end) {
        return 1.0;
    }
    const double span = static_cast<double>(range.end - range.start);
    return std::clamp(static_cast<double>(frame - range.start) / span, 0.0, 1.0);
}

bool move_precedes(const FrameRange& first, const FrameRange& second) {
    // Two zero-length moves on the same frame are simultaneous.
    return first.end <= second.start && !(second.end <= first.start);
}

std::vector<size_t> move_fold_order(const std::vector<Move>& moves) {
    const size_t count = moves.size();
    std::vector<size_t> blockers(count, 0);
    for (size_t i = 0; i < count; ++i) {
        for (size_t j = 0; j < count; ++j) {
            if (i != j && moves[i].element_index == moves[j].element_index
                && move_precedes(moves[j].range, moves[i].range)) {
                ++blockers[i];
            }
        }
    }

    // Kahn's algorithm, always taking the earliest declared ready move.
    std::vector<size_t> order;
    order.reserve(count);
    std::vector<bool> placed(count, false);
    while (order.size() < count) {
        size_t next = count;
        for (size_t i = 0; i < count; ++i) {
            if (!placed[i] && blockers[i] == 0) {
                next = i;
                break;
            }
        }
        if (next == count) {
            break; // frame range precedence has no cycles
        }
        placed[next] = true;
        order.push_back(next);
        for (size_t i = 0; i < count; ++i) {
            if (!placed[i] && moves[i].element_index == moves[next].element_index
                && move_precedes(moves[next].range, moves[i].range)) {
                --blockers[i];
            }
        }
    }
    return order;
}

double evaluate_parameter(const Timeline& timeline, size_t element_index, PoseParameter parameter,
                          int frame, size_t move_limit) {
    double value = timeline.elements[element_index].pose.get(parameter);
    const size_t limit = std::min(move_limit, timeline.move_order.size());
    for (size_t i = 0; i < limit; ++i) {
        const Move& move = timeline.moves[timeline.move_order[i]];
        if (move.element_index != element_index) {
            continue;
        }
        const double fraction = move_fraction(move.range, frame);
        for (const Target& target : move.targets) {
            if (target.parameter == parameter) {
                value += (target.value - value) * fraction;
            }
        }
    }
    return value;
}

Pose evaluate_pose(const Timeline& timeline, size_t element_index, int frame) {
    Pose pose;
    for (PoseParameter parameter : k_pose_parameters) {
        pose.set(parameter, evaluate_parameter(timeline, element_index, parameter, frame,
                                               timeline.move_order.size()));
    }
    const Element& element = timeline.elements[element_index];
    if (element.rose && timeline.frame_rate > 0.0) {
        const Point offset = element.rose->offset_at(frame / timeline.frame_rate);
        pose.x += offset.x;
        pose.y += offset.y;
    }
    return pose;
}

void resolve_move_targets(Timeline& timeline) {
    timeline.move_order = move_fold_order(timeline.moves);
    for (size_t i = 0; i < timeline.move_order.size(); ++i) {
        Move& move = timeline.moves[timeline.move_order[i]];
        Pose start;
        for (PoseParameter parameter : k_pose_parameters) {
            start.set(parameter, evaluate_parameter(timeline, move.element_index, parameter,
                                                    move.range.start, i));
        }

        Pose end = start;
        std::array<bool, k_pose_parameters.size()> touched{};
        auto touch = [&](PoseParameter parameter) {
            touched[static_cast<size_t>(parameter)] = true;
        };
        for (const Operation& op : move.operations) {
            switch (op.op) {
            case TransformOp::Translate:
                end.x += op.a;
                end.y += op.b;
                if (op.a != 0.0) {
                    touch(PoseParameter::X);
                }
                if (op.b != 0.0) {
                    touch(PoseParameter::Y);
                }
                break;
            case TransformOp::Rotate:
                end.rotation += op.a;
                if (op.a != 0.0) {
                    touch(PoseParameter::Rotation);
                }
                break;
            case TransformOp::Scale:
                end.scale *= op.a;
                if (op.a != 1.0) {
                    touch(PoseParameter::Scale);
                }
                break;
            }
        }

        move.targets.clear();
        for (PoseParameter parameter : k_pose_parameters) {
            if (touched[static_cast<size_t>(parameter)]) {
                move.targets.push_back({.parameter = parameter, .value = end.get(parameter)});
            }
        }
    }
}

} // namespace tekanim::core
