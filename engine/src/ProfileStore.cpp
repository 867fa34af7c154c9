#include "skiff/ProfileStore.hpp"
#include "skiff/Logging.hpp"
#include "skiff/RuntimeLogging.hpp"
#include "skiff/Target.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QString>

namespace skiff {

namespace {

const QString kProfilesGroup = QStringLiteral("profiles");

} // namespace

ProfileStore::ProfileStore(std::string path) : path_(std::move(path)) {}

std::string ProfileStore::defaultPath() {
    const std::string fromEnv = rawEnv("SKIFF_RC");
    if (!fromEnv.empty())
        return fromEnv;
    return QDir::home().filePath(QStringLiteral(".skiffrc")).toStdString();
}

bool ProfileStore::load(Error &err) {
    profiles_.clear();
    loaded_ = false;
    const QString file = QString::fromStdString(path_);
    const QFileInfo info(file);
    if (!info.exists()) {
        qCDebug(skProfiles) << "no configuration file at" << file;
        loaded_ = true;
        return true;
    }
    if (!info.isFile() || !info.isReadable()) {
        err = Error::make(ErrorKind::ConfigLoadError, Side::Local, path_,
                          "file is not readable");
        return false;
    }

    QSettings s(file, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = Error::make(ErrorKind::ConfigLoadError, Side::Local, path_,
                          s.status() == QSettings::FormatError
                              ? "malformed file"
                              : "access error");
        return false;
    }
    s.beginGroup(kProfilesGroup);
    const QStringList names = s.childKeys();
    for (const QString &name : names) {
        const std::string locator = s.value(name).toString().toStdString();
        Target parsed;
        Error parseErr;
        if (!parseLocator(locator, parsed, parseErr)) {
            err = Error::make(ErrorKind::ConfigLoadError, Side::Local, path_,
                              "profile '" + name.toStdString() +
                                  "' has an invalid url '" + locator + "'");
            profiles_.clear();
            return false;
        }
        profiles_[name.toStdString()] = locator;
    }
    s.endGroup();
    qCDebug(skProfiles) << "loaded" << profiles_.size() << "profiles from"
                        << file;
    loaded_ = true;
    return true;
}

bool ProfileStore::ensureLoaded(Error &err) {
    return loaded_ || load(err);
}

bool ProfileStore::lookup(const std::string &name, std::string &locator,
                          Error &err) {
    if (!ensureLoaded(err))
        return false;
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        err = Error::make(ErrorKind::ProfileNotFound, Side::Local, name);
        return false;
    }
    locator = it->second;
    return true;
}

bool ProfileStore::list(std::vector<std::pair<std::string, std::string>> &out,
                        Error &err) {
    if (!ensureLoaded(err))
        return false;
    out.assign(profiles_.begin(), profiles_.end());
    return true;
}

bool ProfileStore::add(const std::string &name, const std::string &locator,
                       Error &err) {
    // QSettings reads both slashes as group separators.
    if (name.empty() || name.find_first_of("/\\") != std::string::npos) {
        err = Error::make(ErrorKind::ConfigSaveError, Side::Local, path_,
                          "invalid profile name '" + name + "'");
        return false;
    }
    Target parsed;
    if (!parseLocator(locator, parsed, err))
        return false;
    if (!ensureLoaded(err))
        return false;
    profiles_[name] = locator;
    return save(err);
}

bool ProfileStore::remove(const std::string &name, Error &err) {
    if (!ensureLoaded(err))
        return false;
    if (profiles_.erase(name) == 0) {
        err = Error::make(ErrorKind::ProfileNotFound, Side::Local, name);
        return false;
    }
    return save(err);
}

bool ProfileStore::save(Error &err) {
    QSettings s(QString::fromStdString(path_), QSettings::IniFormat);
    s.clear();
    s.beginGroup(kProfilesGroup);
    for (const auto &kv : profiles_)
        s.setValue(QString::fromStdString(kv.first),
                   QString::fromStdString(kv.second));
    s.endGroup();
    s.sync();
    if (s.status() != QSettings::NoError) {
        err = Error::make(ErrorKind::ConfigSaveError, Side::Local, path_);
        return false;
    }
    qCInfo(skProfiles) << "saved" << profiles_.size() << "profiles to"
                       << QString::fromStdString(path_);
    return true;
}

} // namespace skiff
