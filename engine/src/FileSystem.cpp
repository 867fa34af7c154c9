#include "skiff/FileSystem.hpp"

namespace skiff {

std::string joinPath(const std::string &dir, const std::string &name) {
    if (dir.empty() || dir == ".")
        return name;
    if (name.empty())
        return dir;
    if (!name.empty() && name.front() == '/')
        return name;
    if (dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

std::string parentPath(const std::string &path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos)
        return {};
    if (slash == 0)
        return "/";
    return path.substr(0, slash);
}

std::string baseName(const std::string &path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace skiff
