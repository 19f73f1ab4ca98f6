#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "error.h"

#ifndef TEKANIM_GLOBAL_PROFILE_CONFIG
#define TEKANIM_GLOBAL_PROFILE_CONFIG "/usr/local/share/tekanim/tekprofiles.cfg"
#endif

namespace tekanim::core {

namespace fs = std::filesystem;

enum class DeviceEncoding { Tek4010, Tek4050R12, Png };

struct DeviceProfile {
    std::string name;
    DeviceEncoding encoding = DeviceEncoding::Tek4050R12;
    int screen_width = 1024;
    int screen_height = 780;
    std::string file_type = "BINARY";
};

// Tek 4010 and 4050 R12 coordinates are 10 bits per axis.
constexpr int k_tek_screen_limit = 1024;

constexpr const char k_default_profile_name[] = "tek4050r12";
constexpr const char* k_profiles_config_filename = "tekprofiles.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/tekanim/tekprofiles.cfg";
constexpr const char* k_global_profiles_config_path = TEKANIM_GLOBAL_PROFILE_CONFIG;

bool parse_device_encoding(const std::string& value, DeviceEncoding& out);
const char* device_encoding_name(DeviceEncoding encoding);

std::vector<DeviceProfile> builtin_device_profiles();

// INI-style `[profile NAME]` sections. Errors carry the 1-based line.
bool parse_profiles_config(std::istream& input, std::vector<DeviceProfile>& out, Error& error);
bool load_profiles_config_from_file(const fs::path& path, std::vector<DeviceProfile>& out,
                                    Error& error);

std::optional<fs::path> resolve_user_profiles_config_path();

// Profiles from `overrides` replace built-ins of the same name; new names are appended.
std::vector<DeviceProfile> merge_profiles(std::vector<DeviceProfile> base,
                                          const std::vector<DeviceProfile>& overrides);

const DeviceProfile* find_profile(const std::vector<DeviceProfile>& profiles, const std::string& name);

// Built-ins merged with the first profiles file found: `explicit_path` when
// given (it must exist), otherwise ./tekprofiles.cfg, the user config, then
// the global config.
bool load_device_profiles(const fs::path& explicit_path, std::vector<DeviceProfile>& out,
                          Error& error);

} // namespace tekanim::core
