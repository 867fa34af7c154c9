// Runtime policy helpers for diagnostics.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace skiff {

inline std::string rawEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    return std::string(raw);
}

inline std::string normalizedEnv(const char *name) {
    std::string out = rawEnv(name);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// Full error traces and debug-level categories.
inline bool debugEnvironmentEnabled() {
    return envFlagEnabled("SKIFF_DEBUG");
}

} // namespace skiff
