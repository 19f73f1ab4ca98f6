#include "error.h"

#include <utility>

namespace tekanim::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "NoError";
    case ErrorKind::Parse:
        return "ParseError";
    case ErrorKind::Declaration:
        return "DeclarationError";
    case ErrorKind::Range:
        return "RangeError";
    case ErrorKind::Collaborator:
        return "CollaboratorError";
    case ErrorKind::Output:
        return "OutputError";
    case ErrorKind::Config:
        return "ConfigError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "UnknownError";
}

bool is_script_error(ErrorKind kind) {
    return kind == ErrorKind::Parse || kind == ErrorKind::Declaration || kind == ErrorKind::Range;
}

bool fail(Error& error, ErrorKind kind, std::string message, int line) {
    error.kind = kind;
    error.message = std::move(message);
    error.line = line;
    error.frame = -1;
    return false;
}

std::string format_error(const Error& error) {
    std::string text = error_kind_name(error.kind);
    if (error.line > 0) {
        text += " at line " + std::to_string(error.line);
    }
    if (error.frame >= 0) {
        text += " at frame " + std::to_string(error.frame);
    }
    text += ": " + error.message;
    return text;
}

std::string format_error(const Error& error, const std::string& script_path) {
    if (!is_script_error(error.kind) || script_path.empty()) {
        return format_error(error);
    }
    return script_path + ": " + format_error(error);
}

} // namespace tekanim::core
