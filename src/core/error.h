#pragma once

#include <string>

namespace tekanim::core {

enum class ErrorKind {
    None,
    Parse,        // malformed script syntax
    Declaration,  // reference to an undeclared or duplicate element id
    Range,        // bad frame range or out-of-range value
    Collaborator, // unreadable vector source, device bounds exceeded
    Output,       // I/O failure, invalid archive configuration
    Config,       // malformed device profiles file or command line
    Cancelled,
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    int line = 0;   // 1-based script or config line, 0 if not applicable
    int frame = -1; // frame index, -1 if not applicable
};

const char* error_kind_name(ErrorKind kind);

// Script syntax and semantic errors are raised before any output exists.
bool is_script_error(ErrorKind kind);

// Fills `error` and returns false so call sites can `return fail(...)`.
bool fail(Error& error, ErrorKind kind, std::string message, int line = 0);

std::string format_error(const Error& error);
// Script errors are prefixed with the script path, like a compiler diagnostic.
std::string format_error(const Error& error, const std::string& script_path);

} // namespace tekanim::core
