#pragma once

#include <filesystem>
#include <istream>

#include "error.h"
#include "timeline.h"

namespace tekanim::core {

namespace fs = std::filesystem;

struct ScriptOptions {
    // Relative source paths are resolved against this directory.
    fs::path base_dir;
    // Fail with a collaborator error when a referenced source file is missing.
    bool check_sources = true;
};

// Compiles a whole script into `out`. On failure `out` is left untouched and
// `error` names the kind and the offending line.
bool parse_script(std::istream& in, const ScriptOptions& options, Timeline& out, Error& error);
bool parse_script_file(const fs::path& path, Timeline& out, Error& error);

} // namespace tekanim::core
