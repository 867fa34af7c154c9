#include "skiff/Target.hpp"
#include "skiff/ProfileStore.hpp"
#include "skiff/RuntimeLogging.hpp"

#include <pwd.h>
#include <unistd.h>

namespace skiff {

std::string currentUserName() {
    std::string name = rawEnv("USER");
    if (name.empty())
        name = rawEnv("LOGNAME");
    if (!name.empty())
        return name;
    if (const struct passwd *pw = ::getpwuid(::geteuid())) {
        if (pw->pw_name)
            return pw->pw_name;
    }
    return {};
}

bool parseLocator(const std::string &locator, Target &out, Error &err) {
    Target t;
    std::string rest = locator;
    const auto at = rest.find('@');
    if (at != std::string::npos) {
        t.principal = rest.substr(0, at);
        rest = rest.substr(at + 1);
    } else {
        t.principal = currentUserName();
    }
    const auto colon = rest.find(':');
    if (colon != std::string::npos) {
        t.host = rest.substr(0, colon);
        t.base_directory = rest.substr(colon + 1);
        if (t.base_directory.empty())
            t.base_directory = ".";
    } else {
        t.host = rest;
        t.base_directory = ".";
    }
    if (t.host.empty()) {
        err = Error::make(ErrorKind::InvalidLocator, Side::Local, locator,
                          "empty host");
        return false;
    }
    out = t;
    return true;
}

bool resolveTarget(const std::string &locator, const std::string &profile,
                   ProfileStore &store, Target &out, Error &err) {
    if (!locator.empty())
        return parseLocator(locator, out, err);
    std::string stored;
    if (!store.lookup(profile, stored, err))
        return false;
    return parseLocator(stored, out, err);
}

std::string formatLocator(const Target &t) {
    std::string s;
    if (!t.principal.empty())
        s += t.principal + "@";
    s += t.host;
    if (!t.base_directory.empty() && t.base_directory != ".")
        s += ":" + t.base_directory;
    return s;
}

} // namespace skiff
