// Named locators persisted in an INI file through QSettings. The file is read
// lazily on first use and rewritten wholesale on every mutation.
#pragma once
#include "skiff/Errors.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace skiff {

class ProfileStore {
public:
    static constexpr const char *kDefaultProfile = "default";

    explicit ProfileStore(std::string path);

    // $SKIFF_RC when set, else ~/.skiffrc
    static std::string defaultPath();

    const std::string &path() const { return path_; }

    // A missing file is an empty store; an unreadable or unparsable one is a
    // ConfigLoadError.
    bool load(Error &err);

    bool lookup(const std::string &name, std::string &locator, Error &err);
    // Sorted by profile name.
    bool list(std::vector<std::pair<std::string, std::string>> &out, Error &err);
    // Replaces an existing entry with the same name.
    bool add(const std::string &name, const std::string &locator, Error &err);
    bool remove(const std::string &name, Error &err);

private:
    bool ensureLoaded(Error &err);
    bool save(Error &err);

    std::string path_;
    bool loaded_ = false;
    std::map<std::string, std::string> profiles_;
};

} // namespace skiff
