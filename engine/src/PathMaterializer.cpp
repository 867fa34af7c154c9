#include "skiff/PathMaterializer.hpp"
#include "skiff/Logging.hpp"

#include <QString>

namespace skiff {

PathMaterializer::PathMaterializer(FileSystem &local, FileSystem &remote)
    : local_(local), remote_(remote) {}

bool PathMaterializer::materialize(const TransferCandidate &candidate,
                                   Direction direction,
                                   const TransferPolicy &policy,
                                   std::string &destination, Error &err) {
    FileSystem &target = direction == Direction::Upload ? remote_ : local_;
    if (!policy.preserve_hierarchy) {
        destination = baseName(candidate.relative_path);
        return true;
    }
    const std::string dir = parentPath(candidate.relative_path);
    if (!dir.empty() && !ensureDirectoryChain(target, dir, err))
        return false;
    destination = candidate.relative_path;
    return true;
}

bool PathMaterializer::ensureDirectoryChain(FileSystem &fs,
                                            const std::string &dir,
                                            Error &err) {
    std::string prefix;
    std::size_t pos = 0;
    if (!dir.empty() && dir.front() == '/') {
        prefix = "/";
        pos = 1;
    }
    while (pos <= dir.size()) {
        std::size_t next = dir.find('/', pos);
        if (next == std::string::npos)
            next = dir.size();
        const std::string part = dir.substr(pos, next - pos);
        pos = next + 1;
        if (part.empty() || part == ".")
            continue;
        prefix = prefix.empty() ? part : joinPath(prefix, part);

        switch (fs.probe(prefix, nullptr, err)) {
        case PathState::Directory:
            break;
        case PathState::Missing:
            if (!fs.makeDirectory(prefix, err))
                return false;
            qCDebug(skXfer) << "created"
                            << (fs.side() == Side::Remote ? "remote" : "local")
                            << "directory" << QString::fromStdString(prefix);
            break;
        case PathState::File:
            err = Error::make(ErrorKind::HierarchyConflict, fs.side(), prefix);
            return false;
        case PathState::Unknown:
            return false;
        }
    }
    return true;
}

} // namespace skiff
