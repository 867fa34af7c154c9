#include "skiff/Logging.hpp"

Q_LOGGING_CATEGORY(skSession, "skiff.session", QtWarningMsg)
Q_LOGGING_CATEGORY(skXfer, "skiff.transfer", QtWarningMsg)
Q_LOGGING_CATEGORY(skDiscovery, "skiff.discovery", QtWarningMsg)
Q_LOGGING_CATEGORY(skProfiles, "skiff.profiles", QtWarningMsg)

namespace skiff {

void configureLogging(bool debug) {
    qSetMessagePattern(QStringLiteral("[%{category}] %{type}: %{message}"));
    if (debug)
        QLoggingCategory::setFilterRules(QStringLiteral("skiff.*=true"));
}

} // namespace skiff
