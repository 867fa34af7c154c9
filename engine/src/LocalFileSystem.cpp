#include "skiff/LocalFileSystem.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace skiff {

namespace {

class QFileSource : public ByteSource {
public:
    QFileSource(std::unique_ptr<QFile> file, std::string path)
        : file_(std::move(file)), path_(std::move(path)) {}

    bool read(char *buf, std::size_t cap, std::size_t &got,
              Error &err) override {
        const qint64 n = file_->read(buf, static_cast<qint64>(cap));
        if (n < 0) {
            err = Error::make(ErrorKind::LocalError, Side::Local, path_,
                              file_->errorString().toStdString());
            return false;
        }
        got = static_cast<std::size_t>(n);
        return true;
    }

private:
    std::unique_ptr<QFile> file_;
    std::string path_;
};

class QFileSink : public ByteSink {
public:
    QFileSink(std::unique_ptr<QFile> file, std::string path)
        : file_(std::move(file)), path_(std::move(path)) {}

    bool write(const char *data, std::size_t n, Error &err) override {
        if (file_->write(data, static_cast<qint64>(n)) !=
            static_cast<qint64>(n)) {
            err = Error::make(ErrorKind::LocalError, Side::Local, path_,
                              file_->errorString().toStdString());
            return false;
        }
        return true;
    }

    bool finish(Error &err) override {
        if (!file_->isOpen())
            return true;
        const bool flushed = file_->flush();
        file_->close();
        if (!flushed || file_->error() != QFileDevice::NoError) {
            err = Error::make(ErrorKind::LocalError, Side::Local, path_,
                              file_->errorString().toStdString());
            return false;
        }
        return true;
    }

private:
    std::unique_ptr<QFile> file_;
    std::string path_;
};

} // namespace

LocalFileSystem::LocalFileSystem(std::string root) : root_(std::move(root)) {
    if (root_.empty())
        root_ = ".";
}

QString LocalFileSystem::resolve(const std::string &path) const {
    return QString::fromStdString(joinPath(root_, path.empty() ? "." : path));
}

bool LocalFileSystem::list(const std::string &dir, std::vector<FileInfo> &out,
                           Error &err) {
    const QDir d(resolve(dir));
    if (!d.exists()) {
        err = Error::make(ErrorKind::LocalNotFound, Side::Local,
                          dir.empty() ? "." : dir);
        return false;
    }
    if (!QFileInfo(d.path()).isReadable()) {
        err = Error::make(ErrorKind::LocalError, Side::Local, dir,
                          "directory is not readable");
        return false;
    }
    out.clear();
    const QFileInfoList entries =
        d.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden |
                            QDir::System,
                        QDir::NoSort);
    for (const QFileInfo &fi : entries) {
        FileInfo info;
        info.name = fi.fileName().toStdString();
        info.is_dir = fi.isDir();
        info.is_symlink = fi.isSymLink();
        info.size = fi.isDir() ? 0 : static_cast<std::uint64_t>(fi.size());
        out.push_back(std::move(info));
    }
    return true;
}

// QFileInfo cannot tell "missing" from "not allowed to look", so the probe
// goes through stat(2) and errno.
PathState LocalFileSystem::probe(const std::string &path, std::uint64_t *size,
                                 Error &err) {
    const QByteArray native = QFile::encodeName(resolve(path));
    struct stat st {};
    if (::stat(native.constData(), &st) != 0) {
        const int e = errno;
        if (e == ENOENT || e == ENOTDIR)
            return PathState::Missing;
        err = Error::make(ErrorKind::LocalError, Side::Local, path,
                          std::strerror(e));
        return PathState::Unknown;
    }
    if (S_ISDIR(st.st_mode))
        return PathState::Directory;
    if (size)
        *size = static_cast<std::uint64_t>(st.st_size);
    return PathState::File;
}

bool LocalFileSystem::makeDirectory(const std::string &path, Error &err) {
    if (!QDir().mkdir(resolve(path))) {
        err = Error::make(ErrorKind::LocalError, Side::Local, path,
                          "could not create directory");
        return false;
    }
    return true;
}

std::unique_ptr<ByteSource> LocalFileSystem::openRead(const std::string &path,
                                                      Error &err) {
    auto file = std::make_unique<QFile>(resolve(path));
    if (!file->open(QIODevice::ReadOnly)) {
        err = Error::make(file->exists() ? ErrorKind::LocalError
                                         : ErrorKind::LocalNotFound,
                          Side::Local, path, file->errorString().toStdString());
        return nullptr;
    }
    return std::make_unique<QFileSource>(std::move(file), path);
}

std::unique_ptr<ByteSink> LocalFileSystem::openWrite(const std::string &path,
                                                     Error &err) {
    auto file = std::make_unique<QFile>(resolve(path));
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        err = Error::make(ErrorKind::LocalError, Side::Local, path,
                          file->errorString().toStdString());
        return nullptr;
    }
    return std::make_unique<QFileSink>(std::move(file), path);
}

bool LocalFileSystem::remove(const std::string &path, Error &err) {
    QFile file(resolve(path));
    if (!file.remove()) {
        err = Error::make(ErrorKind::LocalError, Side::Local, path,
                          file.errorString().toStdString());
        return false;
    }
    return true;
}

} // namespace skiff
