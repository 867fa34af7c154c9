// Error kinds reported by the transfer engine. These are values, not
// exceptions: every operation that can fail fills an Error and returns false.
#pragma once
#include <string>

namespace skiff {

enum class ErrorKind {
    None,
    // Connection level (fatal to a whole run)
    ConnectionFailed,
    AuthenticationFailed,
    HostKeyRejected,
    InvalidRemoteBase,
    // Per candidate
    RemoteNotFound,
    LocalNotFound,
    SourceIsDirectory,
    DecodeError,
    OverwriteRefused,
    HierarchyConflict,
    LocalError,
    RemoteError,
    // Resolution and configuration
    InvalidPattern,
    ProfileNotFound,
    InvalidLocator,
    ConfigLoadError,
    ConfigSaveError
};

// Which filesystem an error happened on.
enum class Side { Local, Remote };

struct Error {
    ErrorKind kind = ErrorKind::None;
    Side side = Side::Local;
    std::string subject; // path, profile, locator or host the error is about
    std::string detail;  // underlying backend or filesystem message

    static Error make(ErrorKind kind, Side side, std::string subject,
                      std::string detail = {});

    bool ok() const { return kind == ErrorKind::None; }

    // Connection-level errors abort the run instead of failing one candidate.
    bool isFatal() const;

    // One line, "error: ..." form.
    std::string message() const;
    // Message plus kind, side and the underlying cause.
    std::string trace() const;
};

const char *errorKindName(ErrorKind kind);

} // namespace skiff
