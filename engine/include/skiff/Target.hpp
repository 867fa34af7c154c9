// Remote target resolution from "[user@]host[:path]" locators or profiles.
#pragma once
#include "skiff/Errors.hpp"

#include <string>

namespace skiff {

class ProfileStore;

struct Target {
    std::string principal;
    std::string host;
    std::string base_directory = ".";
};

// Name of the invoking user ($USER, $LOGNAME, then the password database).
std::string currentUserName();

// Splits on the first '@' (principal, default: current user), then on the
// first ':' (base directory, default "."). Fails with InvalidLocator when the
// host part is empty.
bool parseLocator(const std::string &locator, Target &out, Error &err);

// An explicit locator wins; otherwise the profile is looked up in the store
// (ProfileNotFound when absent).
bool resolveTarget(const std::string &locator, const std::string &profile,
                   ProfileStore &store, Target &out, Error &err);

std::string formatLocator(const Target &t);

} // namespace skiff
