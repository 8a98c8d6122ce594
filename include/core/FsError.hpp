#pragma once
#include <stdexcept>
#include <string>

namespace secure_fs {

enum class ErrorKind {
    AccessDenied,    // path escapes every allowed root
    InvalidPath,     // home / cwd / parent cannot be resolved, symlink loops
    NotFound,        // target file or substring absent
    AmbiguousMatch,  // substring occurs more than once
    OutOfRange,      // insert line outside [0, line_count]
    NoHistory,       // undo without a prior edit for that file
    InvalidArgument, // malformed tool arguments
    Io
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AccessDenied: return "AccessDenied";
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AmbiguousMatch: return "AmbiguousMatch";
        case ErrorKind::OutOfRange: return "OutOfRange";
        case ErrorKind::NoHistory: return "NoHistory";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

// Every failure of the core API surfaces as an FsError; the tool layer turns
// it into an error result for the caller.
class FsError : public std::runtime_error {
public:
    FsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}
