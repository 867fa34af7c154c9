// Computes where a candidate lands and prepares its parent directories.
#pragma once
#include "skiff/FileSystem.hpp"
#include "skiff/TransferTypes.hpp"

namespace skiff {

class PathMaterializer {
public:
    PathMaterializer(FileSystem &local, FileSystem &remote);

    // preserve_hierarchy: destination is the full relative path and every
    // parent directory exists afterwards. Otherwise destination is the base
    // name in the destination root and nothing is created.
    bool materialize(const TransferCandidate &candidate, Direction direction,
                     const TransferPolicy &policy, std::string &destination,
                     Error &err);

    // Creates dir component by component from the top; existing directories
    // are fine, anything else in the way is a HierarchyConflict.
    static bool ensureDirectoryChain(FileSystem &fs, const std::string &dir,
                                     Error &err);

private:
    FileSystem &local_;
    FileSystem &remote_;
};

} // namespace skiff
