#include "device_profile.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>

#include "cli_parse.h"

namespace tekanim::core {
namespace {

constexpr int k_max_screen_dimension = 8192;

bool config_error(Error& error, const std::string& message, size_t line_number) {
    return fail(error, ErrorKind::Config, message, static_cast<int>(line_number));
}

// Line of the last entry that decided the profile's encoding or screen size.
struct PendingProfile {
    DeviceProfile profile;
    size_t shape_line = 0;
};

bool close_profile(const PendingProfile& pending, std::vector<DeviceProfile>& parsed, Error& error) {
    const DeviceProfile& profile = pending.profile;
    if (profile.encoding != DeviceEncoding::Png
        && (profile.screen_width > k_tek_screen_limit || profile.screen_height > k_tek_screen_limit)) {
        return config_error(error,
                            "profile '" + profile.name + "': " + device_encoding_name(profile.encoding)
                                + " screens are at most " + std::to_string(k_tek_screen_limit) + "x"
                                + std::to_string(k_tek_screen_limit),
                            pending.shape_line);
    }
    parsed.push_back(profile);
    return true;
}

} // namespace

bool parse_device_encoding(const std::string& value, DeviceEncoding& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "tek4010") {
        out = DeviceEncoding::Tek4010;
        return true;
    }
    if (lower == "tek4050r12" || lower == "r12") {
        out = DeviceEncoding::Tek4050R12;
        return true;
    }
    if (lower == "png") {
        out = DeviceEncoding::Png;
        return true;
    }
    return false;
}

const char* device_encoding_name(DeviceEncoding encoding) {
    switch (encoding) {
    case DeviceEncoding::Tek4010:
        return "tek4010";
    case DeviceEncoding::Tek4050R12:
        return "tek4050r12";
    case DeviceEncoding::Png:
        return "png";
    }
    return "unknown";
}

std::vector<DeviceProfile> builtin_device_profiles() {
    return {
        {.name = "tek4010", .encoding = DeviceEncoding::Tek4010},
        {.name = "tek4050r12", .encoding = DeviceEncoding::Tek4050R12},
        {.name = "png", .encoding = DeviceEncoding::Png},
    };
}

bool parse_profiles_config(std::istream& input, std::vector<DeviceProfile>& out, Error& error) {
    std::vector<DeviceProfile> parsed;
    std::unordered_set<std::string> seen_names;
    std::optional<PendingProfile> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                if (!close_profile(*current, parsed, error)) {
                    return false;
                }
                current.reset();
            }
            std::istringstream iss(trimmed.substr(1, trimmed.size() - 2));
            std::string section_type;
            if (!(iss >> section_type)) {
                return config_error(error, "empty section header", line_number);
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                return config_error(error, "unsupported section '" + section_type + "'", line_number);
            }
            std::string name;
            if (!(iss >> name)) {
                return config_error(error, "missing profile name", line_number);
            }
            std::string extra;
            if (iss >> extra) {
                return config_error(error, "unexpected token '" + extra + "' in profile header",
                                    line_number);
            }
            if (!seen_names.insert(name).second) {
                return config_error(error, "duplicate profile '" + name + "'", line_number);
            }
            PendingProfile def;
            def.profile.name = name;
            def.shape_line = line_number;
            current = def;
            continue;
        }

        if (!current) {
            return config_error(error, "entry outside of profile section", line_number);
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            return config_error(error, "invalid line '" + trimmed + "'", line_number);
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            return config_error(error, "empty key", line_number);
        }
        if (value.empty()) {
            return config_error(error, "empty value for key '" + key + "'", line_number);
        }

        DeviceProfile& profile = current->profile;
        std::string lower_key = to_lower_copy(key);
        if (lower_key == "encoding") {
            if (!parse_device_encoding(value, profile.encoding)) {
                return config_error(error, "unknown encoding '" + value + "'", line_number);
            }
            current->shape_line = line_number;
        } else if (lower_key == "screen_width" || lower_key == "screen_height") {
            int parsed_size = 0;
            if (!parse_positive_int(value, parsed_size) || parsed_size > k_max_screen_dimension) {
                return config_error(error, "invalid " + lower_key + " '" + value + "'", line_number);
            }
            if (lower_key == "screen_width") {
                profile.screen_width = parsed_size;
            } else {
                profile.screen_height = parsed_size;
            }
            current->shape_line = line_number;
        } else if (lower_key == "file_type") {
            std::string upper = value;
            std::ranges::transform(upper, upper.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (upper.size() > 8 || !std::ranges::all_of(upper, [](char c) { return c >= 'A' && c <= 'Z'; })) {
                return config_error(error, "invalid file_type '" + value + "'", line_number);
            }
            profile.file_type = upper;
        } else {
            return config_error(error, "unknown key '" + key + "'", line_number);
        }
    }

    if (current && !close_profile(*current, parsed, error)) {
        return false;
    }

    if (parsed.empty()) {
        return fail(error, ErrorKind::Config, "no profiles defined");
    }
    out = std::move(parsed);
    return true;
}

bool load_profiles_config_from_file(const fs::path& path, std::vector<DeviceProfile>& out,
                                    Error& error) {
    std::ifstream input(path);
    if (!input) {
        return fail(error, ErrorKind::Config, "failed to open '" + path.string() + "'");
    }
    if (!parse_profiles_config(input, out, error)) {
        error.message = path.string() + ": " + error.message;
        return false;
    }
    return true;
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::vector<DeviceProfile> merge_profiles(std::vector<DeviceProfile> base,
                                          const std::vector<DeviceProfile>& overrides) {
    for (const auto& profile : overrides) {
        auto it = std::ranges::find_if(base, [&](const DeviceProfile& p) { return p.name == profile.name; });
        if (it != base.end()) {
            *it = profile;
        } else {
            base.push_back(profile);
        }
    }
    return base;
}

const DeviceProfile* find_profile(const std::vector<DeviceProfile>& profiles, const std::string& name) {
    auto it = std::ranges::find_if(profiles, [&](const DeviceProfile& p) { return p.name == name; });
    if (it == profiles.end()) {
        return nullptr;
    }
    return &*it;
}

bool load_device_profiles(const fs::path& explicit_path, std::vector<DeviceProfile>& out,
                          Error& error) {
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        std::error_code ec;
        if (!fs::exists(explicit_path, ec)) {
            return fail(error, ErrorKind::Config,
                        "profiles file '" + explicit_path.string() + "' does not exist");
        }
        candidates.push_back(explicit_path);
    } else {
        candidates.push_back(fs::path(k_profiles_config_filename));
        if (std::optional<fs::path> user_config = resolve_user_profiles_config_path()) {
            candidates.push_back(*user_config);
        }
        candidates.push_back(fs::path(k_global_profiles_config_path));
    }

    std::vector<DeviceProfile> loaded;
    for (const fs::path& candidate : candidates) {
        std::error_code ec;
        if (!fs::exists(candidate, ec)) {
            continue;
        }
        if (!load_profiles_config_from_file(candidate, loaded, error)) {
            return false;
        }
        break;
    }
    out = merge_profiles(builtin_device_profiles(), loaded);
    return true;
}

} // namespace tekanim::core
