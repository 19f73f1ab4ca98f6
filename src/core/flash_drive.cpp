#include "flash_drive.h"

#include <cctype>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#include "cli_parse.h"

namespace tekanim::core {
namespace {

constexpr int k_number_width = 7;
constexpr int k_type_width = 8;
constexpr int k_name_width = 21;
constexpr int k_frame_number_width = 5;

constexpr std::string_view k_first_marker = "LET F=";
constexpr std::string_view k_final_marker = "IF F>";
constexpr std::string_view k_final_suffix = " THE";

std::string pad_right(std::string value, size_t width) {
    if (value.size() < width) {
        value.append(width - value.size(), ' ');
    }
    return value;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Finds "<line number> <marker><digits>" and reports where the digits are.
bool find_numbered_statement(std::string_view text, std::string_view marker, std::string_view suffix,
                             size_t& digits_begin, size_t& digits_end) {
    size_t pos = text.find(marker);
    while (pos != std::string_view::npos) {
        const bool numbered = pos >= 2 && text[pos - 1] == ' ' && is_digit(text[pos - 2]);
        size_t end = pos + marker.size();
        while (end < text.size() && is_digit(text[end])) {
            ++end;
        }
        const bool has_digits = end > pos + marker.size();
        if (numbered && has_digits && text.substr(end, suffix.size()) == suffix) {
            digits_begin = pos + marker.size();
            digits_end = end;
            return true;
        }
        pos = text.find(marker, pos + 1);
    }
    return false;
}

std::string format_delay(double seconds) {
    std::ostringstream oss;
    oss << seconds;
    return oss.str();
}

} // namespace

std::string build_flash_drive_filename(int number, const std::string& type, const std::string& name,
                                       size_t size) {
    return pad_right(std::to_string(number), k_number_width) + pad_right(type, k_type_width)
        + pad_right(name, k_name_width) + " " + std::to_string(size);
}

bool parse_flash_drive_filename(const std::string& filename, FlashDriveName& out) {
    size_t pos = 0;
    const size_t n = filename.size();

    size_t start = pos;
    while (pos < n && is_digit(filename[pos])) {
        ++pos;
    }
    if (pos == start || pos >= n || !is_space(filename[pos])) {
        return false;
    }
    int number = 0;
    if (!parse_non_negative_int(filename.substr(start, pos - start), number)) {
        return false;
    }

    while (pos < n && is_space(filename[pos])) {
        ++pos;
    }
    start = pos;
    while (pos < n && std::isupper(static_cast<unsigned char>(filename[pos])) != 0) {
        ++pos;
    }
    if (pos == start || pos >= n || !is_space(filename[pos])) {
        return false;
    }
    std::string type = filename.substr(start, pos - start);

    // The size is the trailing run of digits, separated from the name by whitespace.
    size_t size_start = n;
    while (size_start > pos && is_digit(filename[size_start - 1])) {
        --size_start;
    }
    if (size_start == n || size_start == pos || !is_space(filename[size_start - 1])) {
        return false;
    }
    int size = 0;
    if (!parse_non_negative_int(filename.substr(size_start), size)) {
        return false;
    }

    out.number = number;
    out.type = std::move(type);
    out.name = trim_copy(filename.substr(pos, size_start - pos));
    out.size = static_cast<size_t>(size);
    return true;
}

std::string frame_entry_name(int frame_index) {
    return "DATA Frame " + pad_right(std::to_string(frame_index), k_frame_number_width);
}

bool is_player_name(const std::string& name) {
    return to_lower_copy(trim_copy(name)) == to_lower_copy(k_player_name);
}

Bytes build_player_program(int first_file, int final_file, double automate_delay) {
    const bool automated = automate_delay > 0.0;
    const std::string rem = automated ? "" : "REM ";
    const std::vector<std::string> lines = {
        "1 GO TO 100",
        "4 GO TO 130",
        "100 INIT",
        "110 DIM S$(8190)",
        "120 LET F=" + std::to_string(first_file - 1),
        "130 F=F+1",
        "140 IF F>" + std::to_string(final_file) + " THEN 240",
        "150 FIND@5:F",
        "160 PAGE",
        "170 READ@5:S$",
        std::string("180 IF S$=\"X\" THEN ") + (automated ? "210" : "260"),
        "190 CALL \"RDRAW\",S$,1,0,0",
        "200 GO TO 170",
        "210 " + rem + " PRINT @53:\"AAAA\"",
        "220 " + rem + " CALL \"!PAUSE\"," + format_delay(automate_delay),
        "230 GO TO 130",
        "240 HOME",
        "250 PRINT \"No more frames\"",
        "260 END ",
        "",
        "",
    };

    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\r';
        }
        text += lines[i];
    }
    return Bytes(text.begin(), text.end());
}

bool get_player_program_bounds(const Bytes& player, int& first_file, int& final_file) {
    const std::string text(player.begin(), player.end());
    size_t begin = 0;
    size_t end = 0;
    int first = 0;
    if (!find_numbered_statement(text, k_first_marker, "", begin, end)
        || !parse_non_negative_int(text.substr(begin, end - begin), first)) {
        return false;
    }
    int last = 0;
    if (!find_numbered_statement(text, k_final_marker, k_final_suffix, begin, end)
        || !parse_non_negative_int(text.substr(begin, end - begin), last)) {
        return false;
    }
    first_file = first + 1;
    final_file = last;
    return true;
}

bool set_player_program_bounds(Bytes& player, int first_file, int final_file) {
    std::string text(player.begin(), player.end());
    size_t begin = 0;
    size_t end = 0;
    if (!find_numbered_statement(text, k_first_marker, "", begin, end)) {
        return false;
    }
    text.replace(begin, end - begin, std::to_string(first_file - 1));
    if (!find_numbered_statement(text, k_final_marker, k_final_suffix, begin, end)) {
        return false;
    }
    text.replace(begin, end - begin, std::to_string(final_file));
    player.assign(text.begin(), text.end());
    return true;
}

} // namespace tekanim::core
