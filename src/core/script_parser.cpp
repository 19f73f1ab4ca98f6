#include "script_parser.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cli_parse.h"

namespace tekanim::core {
namespace {

struct Token {
    std::string text;
    bool quoted = false;
};

// Frame ranges are checked once the whole script has been read, because the
// animation statement that fixes the frame count may come last.
struct PendingRange {
    FrameRange range;
    int line = 0;
    std::string what;
};

bool tokenize(const std::string& line, std::vector<Token>& out, std::string& error) {
    out.clear();
    size_t pos = 0;
    while (pos < line.size()) {
        if (std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
            ++pos;
            continue;
        }
        Token token;
        if (line[pos] == '"') {
            if (!parse_quoted(line, pos, token.text, error)) {
                return false;
            }
            token.quoted = true;
        } else {
            size_t end = pos;
            while (end < line.size() && std::isspace(static_cast<unsigned char>(line[end])) == 0) {
                ++end;
            }
            token.text = line.substr(pos, end - pos);
            pos = end;
        }
        out.push_back(std::move(token));
    }
    return true;
}

class ScriptCompiler {
public:
    ScriptCompiler(const ScriptOptions& options, Error& error)
        : options_(options), error_(error) {}

    bool statement(const std::vector<Token>& tokens, int line) {
        line_ = line;
        const std::string& keyword = tokens[0].text;
        if (tokens[0].quoted) {
            return syntax("statement cannot start with a quoted string");
        }
        if (keyword == "animation") {
            return animation(tokens);
        }
        if (keyword == "canvas") {
            return canvas(tokens);
        }
        if (keyword == "element") {
            return element(tokens);
        }
        if (keyword == "move") {
            return move(tokens);
        }
        if (keyword == "line") {
            return line_statement(tokens);
        }
        return syntax("unknown statement '" + keyword + "'");
    }

    bool finish(Timeline& out) {
        if (!has_animation_) {
            return fail(error_, ErrorKind::Parse, "missing animation statement");
        }
        for (const auto& pending : pending_ranges_) {
            const FrameRange& r = pending.range;
            if (r.start < 0 || r.end < 0) {
                return fail(error_, ErrorKind::Range,
                            pending.what + " range " + range_text(r) + " is negative", pending.line);
            }
            if (r.end < r.start) {
                return fail(error_, ErrorKind::Range,
                            pending.what + " range " + range_text(r) + " ends before it starts",
                            pending.line);
            }
            if (r.end >= timeline_.frame_count) {
                return fail(error_, ErrorKind::Range,
                            pending.what + " range " + range_text(r) + " exceeds the last frame "
                                + std::to_string(timeline_.frame_count - 1),
                            pending.line);
            }
        }
        if (options_.check_sources) {
            for (const auto& element : timeline_.elements) {
                std::error_code ec;
                if (!fs::is_regular_file(element.source_path, ec)) {
                    return fail(error_, ErrorKind::Collaborator,
                                "vector source not found: " + to_quoted(element.source_path),
                                element.line);
                }
            }
        }
        resolve_move_targets(timeline_);
        out = std::move(timeline_);
        return true;
    }

private:
    bool syntax(std::string message) {
        return fail(error_, ErrorKind::Parse, std::move(message), line_);
    }

    bool range_error(std::string message) {
        return fail(error_, ErrorKind::Range, std::move(message), line_);
    }

    static std::string range_text(const FrameRange& r) {
        return std::to_string(r.start) + ".." + std::to_string(r.end);
    }

    // animation frames <N> [fps <R>] | animation duration <S> [fps <R>]
    bool animation(const std::vector<Token>& tokens) {
        if (has_animation_) {
            return syntax("duplicate animation statement");
        }
        bool has_frames = false;
        bool has_duration = false;
        int frames = 0;
        double duration = 0.0;
        double fps = k_default_frame_rate;
        for (size_t i = 1; i < tokens.size(); i += 2) {
            if (i + 1 >= tokens.size()) {
                return syntax("animation option '" + tokens[i].text + "' is missing a value");
            }
            const std::string& key = tokens[i].text;
            const std::string& value = tokens[i + 1].text;
            if (key == "frames") {
                if (has_frames || has_duration) {
                    return syntax("animation length given twice");
                }
                if (!parse_int(value, frames)) {
                    return syntax("invalid frame count '" + value + "'");
                }
                has_frames = true;
            } else if (key == "duration") {
                if (has_frames || has_duration) {
                    return syntax("animation length given twice");
                }
                if (!parse_double(value, duration)) {
                    return syntax("invalid duration '" + value + "'");
                }
                has_duration = true;
            } else if (key == "fps") {
                if (!parse_double(value, fps)) {
                    return syntax("invalid frame rate '" + value + "'");
                }
            } else {
                return syntax("unknown animation option '" + key + "'");
            }
        }
        if (!has_frames && !has_duration) {
            return syntax("animation needs 'frames <N>' or 'duration <seconds>'");
        }
        if (fps <= 0.0) {
            return range_error("frame rate must be positive");
        }
        if (has_duration) {
            if (duration <= 0.0) {
                return range_error("duration must be positive");
            }
            const double total = duration * fps;
            if (total >= static_cast<double>(std::numeric_limits<int>::max())) {
                return range_error("animation is too long: " + std::to_string(total) + " frames");
            }
            frames = static_cast<int>(total);
        }
        if (frames <= 0) {
            return range_error("animation must have at least one frame");
        }
        timeline_.frame_count = frames;
        timeline_.frame_rate = fps;
        has_animation_ = true;
        return true;
    }

    bool canvas(const std::vector<Token>& tokens) {
        if (tokens.size() != 3) {
            return syntax("canvas expects '<x0>,<y0> <x1>,<y1>'");
        }
        double x0 = 0.0;
        double y0 = 0.0;
        double x1 = 0.0;
        double y1 = 0.0;
        if (!parse_double_pair(tokens[1].text, x0, y0) || !parse_double_pair(tokens[2].text, x1, y1)) {
            return syntax("invalid canvas corners");
        }
        if (x1 <= x0 || y1 <= y0) {
            return range_error("canvas must have positive width and height");
        }
        timeline_.canvas = make_bounds(x0, y0, x1, y1);
        return true;
    }

    bool element(const std::vector<Token>& tokens) {
        if (tokens.size() < 3 || tokens[1].quoted || !tokens[2].quoted) {
            return syntax("element expects '<id> \"<source path>\"'");
        }
        Element parsed;
        parsed.id = tokens[1].text;
        parsed.line = line_;
        if (timeline_.find_element(parsed.id) != nullptr) {
            return fail(error_, ErrorKind::Declaration,
                        "element '" + parsed.id + "' is already declared", line_);
        }
        fs::path source = tokens[2].text;
        if (source.is_relative() && !options_.base_dir.empty()) {
            source = options_.base_dir / source;
        }
        parsed.source_path = source.lexically_normal().string();

        for (size_t i = 3; i < tokens.size(); ++i) {
            const std::string& option = tokens[i].text;
            if (option == "fliph") {
                parsed.flip_horizontal = true;
                continue;
            }
            if (option == "flipv") {
                parsed.flip_vertical = true;
                continue;
            }
            if (i + 1 >= tokens.size()) {
                return syntax("element option '" + option + "' is missing a value");
            }
            const std::string& value = tokens[++i].text;
            if (option == "at") {
                if (!parse_double_pair(value, parsed.pose.x, parsed.pose.y)) {
                    return syntax("invalid position '" + value + "'");
                }
            } else if (option == "rotate") {
                if (!parse_double(value, parsed.pose.rotation)) {
                    return syntax("invalid rotation '" + value + "'");
                }
            } else if (option == "scale") {
                if (!parse_double(value, parsed.pose.scale)) {
                    return syntax("invalid scale '" + value + "'");
                }
                if (parsed.pose.scale <= 0.0) {
                    return range_error("scale must be positive");
                }
            } else if (option == "visible") {
                FrameRange range;
                if (!parse_frame_range_token(value, range.start, range.end)) {
                    return syntax("invalid frame range '" + value + "'");
                }
                parsed.visible = range;
                pending_ranges_.push_back({range, line_, "visibility"});
            } else if (option == "blink") {
                Blink blink;
                if (!parse_blink(value, blink)) {
                    return false;
                }
                parsed.blink = blink;
            } else if (option == "rose") {
                Rose rose;
                if (!parse_rose(value, rose)) {
                    return false;
                }
                parsed.rose = rose;
            } else {
                return syntax("unknown element option '" + option + "'");
            }
        }
        timeline_.elements.push_back(std::move(parsed));
        return true;
    }

    // <on>,<off>[,<phase>]
    bool parse_blink(const std::string& value, Blink& out) {
        std::vector<int> fields;
        size_t start = 0;
        while (true) {
            size_t comma = value.find(',', start);
            int field = 0;
            if (!parse_int(value.substr(start, comma - start), field)) {
                return syntax("invalid blink schedule '" + value + "'");
            }
            fields.push_back(field);
            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }
        if (fields.size() != 2 && fields.size() != 3) {
            return syntax("blink expects '<on>,<off>[,<phase>]'");
        }
        for (int field : fields) {
            if (field < 0) {
                return range_error("blink values cannot be negative");
            }
        }
        if (fields[0] == 0) {
            return range_error("blink must be on for at least one frame");
        }
        out.on = fields[0];
        out.off = fields[1];
        const long long period = static_cast<long long>(out.on) + out.off;
        out.phase = fields.size() == 3 ? static_cast<int>(fields[2] % period) : 0;
        return true;
    }

    // Comma-separated words, each a key followed by its number:
    // k<k>, nu<nu>, sx<stretch>, sy<stretch>, r<degrees>, dt<seconds>.
    bool parse_rose(const std::string& value, Rose& out) {
        static const std::pair<std::string_view, double Rose::*> keys[] = {
            {"nu", &Rose::nu},
            {"sx", &Rose::stretch_x},
            {"sy", &Rose::stretch_y},
            {"dt", &Rose::t_offset},
            {"k", &Rose::k},
            {"r", &Rose::rotate},
        };
        size_t start = 0;
        while (true) {
            const size_t comma = value.find(',', start);
            const std::string word = value.substr(start, comma - start);
            bool matched = false;
            for (const auto& [key, field] : keys) {
                if (word.starts_with(key)) {
                    if (!parse_double(word.substr(key.size()), out.*field)) {
                        return syntax("invalid rose value '" + word + "'");
                    }
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                return syntax("unknown rose parameter '" + word + "'");
            }
            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }
        return true;
    }

    bool move(const std::vector<Token>& tokens) {
        if (tokens.size() < 3 || tokens[1].quoted) {
            return syntax("move expects '<id> <start>..<end> <operation>...'");
        }
        Move parsed;
        parsed.element_id = tokens[1].text;
        parsed.line = line_;

        bool found = false;
        for (size_t i = 0; i < timeline_.elements.size(); ++i) {
            if (timeline_.elements[i].id == parsed.element_id) {
                parsed.element_index = i;
                found = true;
                break;
            }
        }
        if (!found) {
            return fail(error_, ErrorKind::Declaration,
                        "move references undeclared element '" + parsed.element_id + "'", line_);
        }

        if (!parse_frame_range_token(tokens[2].text, parsed.range.start, parsed.range.end)) {
            return syntax("invalid frame range '" + tokens[2].text + "'");
        }

        for (size_t i = 3; i < tokens.size(); ++i) {
            const std::string& op = tokens[i].text;
            if (i + 1 >= tokens.size()) {
                return syntax("operation '" + op + "' is missing a value");
            }
            const std::string& value = tokens[++i].text;
            Operation operation;
            if (op == "translate") {
                operation.op = TransformOp::Translate;
                if (!parse_double_pair(value, operation.a, operation.b)) {
                    return syntax("invalid translation '" + value + "'");
                }
            } else if (op == "rotate") {
                operation.op = TransformOp::Rotate;
                if (!parse_double(value, operation.a)) {
                    return syntax("invalid rotation '" + value + "'");
                }
            } else if (op == "scale") {
                operation.op = TransformOp::Scale;
                if (!parse_double(value, operation.a)) {
                    return syntax("invalid scale '" + value + "'");
                }
                if (operation.a <= 0.0) {
                    return range_error("scale factor must be positive");
                }
            } else {
                return syntax("unknown move operation '" + op + "'");
            }
            parsed.operations.push_back(operation);
        }
        if (parsed.operations.empty()) {
            return syntax("move needs at least one operation");
        }
        pending_ranges_.push_back({parsed.range, line_, "move"});
        timeline_.moves.push_back(std::move(parsed));
        return true;
    }

    // line <x1>,<y1> <x2>,<y2> [frames <s>..<e>]
    bool line_statement(const std::vector<Token>& tokens) {
        if (tokens.size() != 3 && tokens.size() != 5) {
            return syntax("line expects '<x1>,<y1> <x2>,<y2> [frames <start>..<end>]'");
        }
        Line parsed;
        parsed.line = line_;
        if (!parse_double_pair(tokens[1].text, parsed.from.x, parsed.from.y)
            || !parse_double_pair(tokens[2].text, parsed.to.x, parsed.to.y)) {
            return syntax("invalid line endpoints");
        }
        if (tokens.size() == 5) {
            if (tokens[3].text != "frames") {
                return syntax("unknown line option '" + tokens[3].text + "'");
            }
            FrameRange range;
            if (!parse_frame_range_token(tokens[4].text, range.start, range.end)) {
                return syntax("invalid frame range '" + tokens[4].text + "'");
            }
            parsed.frames = range;
            pending_ranges_.push_back({range, line_, "line"});
        }
        timeline_.lines.push_back(parsed);
        return true;
    }

    const ScriptOptions& options_;
    Error& error_;
    Timeline timeline_;
    std::vector<PendingRange> pending_ranges_;
    bool has_animation_ = false;
    int line_ = 0;
};

} // namespace

bool parse_script(std::istream& in, const ScriptOptions& options, Timeline& out, Error& error) {
    ScriptCompiler compiler(options, error);
    std::vector<Token> tokens;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.starts_with('#')) {
            continue;
        }
        std::string tokenize_error;
        if (!tokenize(trimmed, tokens, tokenize_error)) {
            return fail(error, ErrorKind::Parse, tokenize_error, line_number);
        }
        if (!compiler.statement(tokens, line_number)) {
            return false;
        }
    }
    if (in.bad()) {
        return fail(error, ErrorKind::Parse, "failed to read script");
    }
    return compiler.finish(out);
}

bool parse_script_file(const fs::path& path, Timeline& out, Error& error) {
    std::ifstream in(path);
    if (!in) {
        return fail(error, ErrorKind::Parse, "failed to open script " + to_quoted(path.string()));
    }
    ScriptOptions options;
    options.base_dir = path.parent_path();
    return parse_script(in, options, out, error);
}

} // namespace tekanim::core
