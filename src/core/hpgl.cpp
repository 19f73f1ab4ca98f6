#include "hpgl.h"

#include <cmath>
#include <numbers>
#include <sstream>
#include <string_view>
#include <vector>

#include "cli_parse.h"

namespace tekanim::core {
namespace {

constexpr double k_arc_step_degrees = 4.0;

// Accumulates strokes from the arguments of HPGL pen commands.
class Pen {
public:
    void up_move(const std::vector<double>& args) {
        down_ = false;
        flush();
        if (args.size() >= 2) {
            pos_ = {args[args.size() - 2], args[args.size() - 1]};
        }
    }

    void down_move(const std::vector<double>& args) {
        down_ = true;
        if (current_.empty()) {
            current_.push_back(pos_);
        }
        for (size_t i = 0; i + 1 < args.size(); i += 2) {
            current_.push_back({args[i], args[i + 1]});
        }
        pos_ = current_.back();
    }

    void either_move(const std::vector<double>& args) {
        if (down_) {
            down_move(args);
        } else {
            up_move(args);
        }
    }

    void relative_move(const std::vector<double>& args) {
        std::vector<double> absolute;
        absolute.reserve(args.size());
        Point cursor = pos_;
        for (size_t i = 0; i + 1 < args.size(); i += 2) {
            cursor.x += args[i];
            cursor.y += args[i + 1];
            absolute.push_back(cursor.x);
            absolute.push_back(cursor.y);
        }
        either_move(absolute);
    }

    // AA cx,cy,sweep: arc around (cx, cy), sweep in degrees anticlockwise.
    void arc(const std::vector<double>& args) {
        if (args.size() < 3) {
            return;
        }
        const double cx = args[0];
        const double cy = args[1];
        const double sweep = args[2] * std::numbers::pi / 180.0;

        const double dx = pos_.x - cx;
        const double dy = pos_.y - cy;
        const double radius = std::sqrt(dx * dx + dy * dy);
        const double theta = std::atan2(dy, dx);

        const auto steps = static_cast<int>(std::ceil(std::abs(args[2]) / k_arc_step_degrees));
        if (steps > 1) {
            const double step = sweep / steps;
            for (int i = 1; i < steps; ++i) {
                either_move({cx + radius * std::cos(theta + i * step),
                             cy + radius * std::sin(theta + i * step)});
            }
        }
        either_move({cx + radius * std::cos(theta + sweep), cy + radius * std::sin(theta + sweep)});
    }

    // Saves the current stroke (if any) and starts a new one.
    void flush() {
        if (!current_.empty()) {
            strokes_.push_back(std::move(current_));
        }
        current_.clear();
    }

    Strokes finish() {
        flush();
        return std::move(strokes_);
    }

private:
    Strokes strokes_;
    Stroke current_;
    Point pos_;
    bool down_ = false;
};

bool parse_arguments(std::string_view text, std::vector<double>& out) {
    out.clear();
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        size_t end = (comma == std::string_view::npos) ? text.size() : comma;
        std::string token = trim_copy(std::string(text.substr(start, end - start)));
        if (!token.empty()) {
            double value = 0.0;
            if (!parse_double(token, value)) {
                return false;
            }
            out.push_back(value);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return true;
}

} // namespace

Strokes parse_hpgl(std::istream& in) {
    Pen pen;
    std::vector<double> args;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream statements(line);
        std::string statement;
        while (std::getline(statements, statement, ';')) {
            statement = trim_copy(statement);
            if (statement.size() < 2) {
                continue;
            }
            const std::string op = statement.substr(0, 2);
            if (!parse_arguments(std::string_view(statement).substr(2), args)) {
                continue;
            }

            if (op == "PU") {
                pen.up_move(args);
            } else if (op == "PD") {
                pen.down_move(args);
            } else if (op == "PA") {
                pen.either_move(args);
            } else if (op == "PR") {
                pen.relative_move(args);
            } else if (op == "AA") {
                pen.arc(args);
            }
        }
    }
    return pen.finish();
}

Strokes parse_hpgl_text(const std::string& text) {
    std::istringstream in(text);
    return parse_hpgl(in);
}

} // namespace tekanim::core
