#include "skiff/PathDiscovery.hpp"
#include "skiff/Logging.hpp"

#include <QString>

#include <set>

namespace skiff {

namespace {

// The relative shape is the same for both sides: no "./" prefix, '/' only.
std::string childPath(const std::string &prefix, const std::string &name) {
    return prefix.empty() ? name : prefix + "/" + name;
}

bool walk(FileSystem &fs, const std::string &root, const std::string &prefix,
          bool recursive, std::vector<TransferCandidate> &out, Error &err) {
    std::vector<FileInfo> entries;
    const std::string dir = prefix.empty() ? root : joinPath(root, prefix);
    if (!fs.list(dir, entries, err))
        return false;
    qCDebug(skDiscovery) << "listed" << QString::fromStdString(dir) << "->"
                         << entries.size() << "entries";
    for (const auto &entry : entries) {
        const std::string rel = childPath(prefix, entry.name);
        if (!entry.is_dir) {
            out.push_back(TransferCandidate{rel, false});
            continue;
        }
        if (!recursive)
            continue;
        if (entry.is_symlink) {
            qCDebug(skDiscovery) << "not following directory link"
                                 << QString::fromStdString(rel);
            continue;
        }
        if (!walk(fs, root, rel, recursive, out, err))
            return false;
    }
    return true;
}

} // namespace

PathFilter::PathFilter(const std::string &pattern, bool caseInsensitive,
                       bool invert)
    : pattern_(pattern),
      regex_(QString::fromStdString(pattern),
             caseInsensitive ? QRegularExpression::CaseInsensitiveOption
                             : QRegularExpression::NoPatternOption),
      invert_(invert) {}

std::string PathFilter::errorString() const {
    return regex_.errorString().toStdString();
}

bool PathFilter::matches(const std::string &path) const {
    const bool found =
        regex_.match(QString::fromStdString(path)).hasMatch();
    return found != invert_;
}

std::vector<TransferCandidate>
PathFilter::apply(const std::vector<TransferCandidate> &in) const {
    std::vector<TransferCandidate> out;
    out.reserve(in.size());
    for (const auto &c : in) {
        if (matches(c.relative_path))
            out.push_back(c);
    }
    return out;
}

bool discover(FileSystem &fs, const std::string &root,
              const std::optional<std::string> &pattern,
              const DiscoveryOptions &options,
              std::vector<TransferCandidate> &out, Error &err) {
    out.clear();
    std::optional<PathFilter> filter;
    if (pattern) {
        filter.emplace(*pattern, options.case_insensitive, options.invert);
        if (!filter->isValid()) {
            err = Error::make(ErrorKind::InvalidPattern, Side::Local, *pattern,
                              filter->errorString());
            return false;
        }
    }

    std::vector<TransferCandidate> found;
    if (!walk(fs, root, std::string(), options.recursive, found, err))
        return false;

    std::set<std::string> seen;
    for (auto &c : found) {
        if (!seen.insert(c.relative_path).second)
            continue;
        if (filter && !filter->matches(c.relative_path))
            continue;
        out.push_back(std::move(c));
    }
    qCDebug(skDiscovery) << "discovered" << out.size() << "candidates on"
                         << (fs.side() == Side::Remote ? "remote" : "local")
                         << "side";
    return true;
}

std::vector<TransferCandidate>
explicitCandidates(const std::vector<std::string> &names, Direction direction,
                   FileSystem &local) {
    std::vector<TransferCandidate> out;
    for (const auto &name : names) {
        if (direction == Direction::Upload) {
            // Missing or unprobeable names are kept; execution reports them.
            Error probeErr;
            if (local.probe(name, nullptr, probeErr) == PathState::Directory) {
                qCInfo(skDiscovery) << "skipping local directory"
                                    << QString::fromStdString(name);
                continue;
            }
        }
        out.push_back(TransferCandidate{name, false});
    }
    return out;
}

} // namespace skiff
