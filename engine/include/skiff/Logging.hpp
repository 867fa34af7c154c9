// Qt logging categories used across the engine. Everything goes to stderr;
// stdout is reserved for transferred paths and streamed data.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(skSession)
Q_DECLARE_LOGGING_CATEGORY(skXfer)
Q_DECLARE_LOGGING_CATEGORY(skDiscovery)
Q_DECLARE_LOGGING_CATEGORY(skProfiles)

namespace skiff {

// Warnings only by default; debug enables every level of skiff.* categories.
void configureLogging(bool debug);

} // namespace skiff
