// Value types exchanged between discovery, materialization and execution.
#pragma once
#include "skiff/Errors.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace skiff {

enum class Direction { Upload, Download };

enum class TransferMode {
    File,   // whole file by path on both ends
    Stream  // one end bound to stdin (upload) or stdout (download)
};

struct TransferPolicy {
    bool overwrite_allowed = false;
    bool preserve_hierarchy = false;
    bool delete_source_on_success = false;
    bool case_insensitive_match = false;
    bool invert_match = false;
};

// A file eligible for transfer. Paths use '/' and are relative to the
// discovery root unless the user named them explicitly.
struct TransferCandidate {
    std::string relative_path;
    bool is_directory = false;
};

struct TransferOutcome {
    enum class Status { Succeeded, Skipped, Failed };

    Status status = Status::Failed;
    std::string source;
    // Unset for a stream sink, which has no path.
    std::optional<std::string> destination;
    std::string reason; // why a candidate was skipped
    Error error;        // why a candidate failed
    // Non-fatal problem after a successful write (source removal failed).
    std::string warning;

    static TransferOutcome succeeded(std::string source,
                                     std::optional<std::string> destination);
    static TransferOutcome skipped(std::string source, std::string reason);
    static TransferOutcome failed(std::string source, Error error);

    bool ok() const { return status == Status::Succeeded; }
};

// (bytes transferred, bytes total); FileMode only.
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

const char *directionName(Direction d);

} // namespace skiff
