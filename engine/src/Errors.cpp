#include "skiff/Errors.hpp"

#include <sstream>

namespace skiff {

namespace {

std::string quoted(const std::string &s) { return "'" + s + "'"; }

} // namespace

Error Error::make(ErrorKind kind, Side side, std::string subject,
                  std::string detail) {
    Error e;
    e.kind = kind;
    e.side = side;
    e.subject = std::move(subject);
    e.detail = std::move(detail);
    return e;
}

bool Error::isFatal() const {
    switch (kind) {
    case ErrorKind::ConnectionFailed:
    case ErrorKind::AuthenticationFailed:
    case ErrorKind::HostKeyRejected:
    case ErrorKind::InvalidRemoteBase:
        return true;
    default:
        return false;
    }
}

std::string Error::message() const {
    const char *where = side == Side::Remote ? "remote" : "local";
    std::string text;
    switch (kind) {
    case ErrorKind::None:
        return {};
    case ErrorKind::ConnectionFailed:
        text = "unable to connect to " + quoted(subject);
        break;
    case ErrorKind::AuthenticationFailed:
        text = "authentication refused for " + quoted(subject);
        break;
    case ErrorKind::HostKeyRejected:
        text = "host key for " + quoted(subject) + " could not be verified";
        break;
    case ErrorKind::InvalidRemoteBase:
        text = "invalid remote folder " + quoted(subject);
        break;
    case ErrorKind::RemoteNotFound:
        text = "remote file " + quoted(subject) + " not found";
        break;
    case ErrorKind::LocalNotFound:
        text = "local file " + quoted(subject) + " not found";
        break;
    case ErrorKind::SourceIsDirectory:
        text = "refusing to transfer directory " + quoted(subject);
        break;
    case ErrorKind::DecodeError:
        text = "unable to decode received data. try with the --binary option";
        break;
    case ErrorKind::OverwriteRefused:
        text = std::string(where) + " file " + quoted(subject) +
               " would be overwritten by transfer (use --force)";
        break;
    case ErrorKind::HierarchyConflict:
        text = std::string(where) + " file " + quoted(subject) +
               " already exists where a folder is required";
        break;
    case ErrorKind::LocalError:
    case ErrorKind::RemoteError:
        text = std::string(where) + " operation failed on " + quoted(subject);
        if (!detail.empty())
            text += ": " + detail;
        break;
    case ErrorKind::InvalidPattern:
        text = "invalid expression " + quoted(subject);
        if (!detail.empty())
            text += ": " + detail;
        break;
    case ErrorKind::ProfileNotFound:
        text = "profile " + quoted(subject) + " not found in configuration file";
        break;
    case ErrorKind::InvalidLocator:
        text = "invalid url " + quoted(subject);
        break;
    case ErrorKind::ConfigLoadError:
        text = "unable to load configuration file " + quoted(subject);
        break;
    case ErrorKind::ConfigSaveError:
        text = "unable to save configuration file " + quoted(subject);
        if (!detail.empty())
            text += ": " + detail;
        break;
    }
    return "error: " + text;
}

std::string Error::trace() const {
    std::ostringstream out;
    out << message() << "\n"
        << "  kind: " << errorKindName(kind) << "\n"
        << "  side: " << (side == Side::Remote ? "remote" : "local") << "\n";
    if (!subject.empty())
        out << "  subject: " << subject << "\n";
    if (!detail.empty())
        out << "  caused by: " << detail << "\n";
    return out.str();
}

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "None";
    case ErrorKind::ConnectionFailed: return "ConnectionFailed";
    case ErrorKind::AuthenticationFailed: return "AuthenticationFailed";
    case ErrorKind::HostKeyRejected: return "HostKeyRejected";
    case ErrorKind::InvalidRemoteBase: return "InvalidRemoteBase";
    case ErrorKind::RemoteNotFound: return "RemoteNotFound";
    case ErrorKind::LocalNotFound: return "LocalNotFound";
    case ErrorKind::SourceIsDirectory: return "SourceIsDirectory";
    case ErrorKind::DecodeError: return "DecodeError";
    case ErrorKind::OverwriteRefused: return "OverwriteRefused";
    case ErrorKind::HierarchyConflict: return "HierarchyConflict";
    case ErrorKind::LocalError: return "LocalError";
    case ErrorKind::RemoteError: return "RemoteError";
    case ErrorKind::InvalidPattern: return "InvalidPattern";
    case ErrorKind::ProfileNotFound: return "ProfileNotFound";
    case ErrorKind::InvalidLocator: return "InvalidLocator";
    case ErrorKind::ConfigLoadError: return "ConfigLoadError";
    case ErrorKind::ConfigSaveError: return "ConfigSaveError";
    }
    return "Unknown";
}

} // namespace skiff
