// Enumerates transfer candidates under a root, locally or remotely.
#pragma once
#include "skiff/FileSystem.hpp"
#include "skiff/TransferTypes.hpp"

#include <QRegularExpression>

#include <optional>
#include <string>
#include <vector>

namespace skiff {

struct DiscoveryOptions {
    bool recursive = false;
    bool case_insensitive = false;
    bool invert = false;
};

// Keeps a path iff the pattern matches somewhere in it, XOR invert.
class PathFilter {
public:
    PathFilter(const std::string &pattern, bool caseInsensitive, bool invert);

    bool isValid() const { return regex_.isValid(); }
    std::string errorString() const;
    const std::string &pattern() const { return pattern_; }

    bool matches(const std::string &path) const;
    std::vector<TransferCandidate>
    apply(const std::vector<TransferCandidate> &in) const;

private:
    std::string pattern_;
    QRegularExpression regex_;
    bool invert_;
};

// Non-recursive: the non-directory children of root. Recursive: every
// non-directory node under root, depth first, relative to root with '/'.
// Links to directories are neither returned nor descended into. Without a
// pattern every candidate is kept.
bool discover(FileSystem &fs, const std::string &root,
              const std::optional<std::string> &pattern,
              const DiscoveryOptions &options,
              std::vector<TransferCandidate> &out, Error &err);

// Explicit names bypass discovery. For uploads, local directories are dropped
// here; for downloads they are kept and fail when executed.
std::vector<TransferCandidate>
explicitCandidates(const std::vector<std::string> &names, Direction direction,
                   FileSystem &local);

} // namespace skiff
