#include "skiff/RemoteFileSystem.hpp"

namespace skiff {

namespace {

class SftpFileSource : public ByteSource {
public:
    SftpFileSource(std::unique_ptr<SftpFile> file, std::string path)
        : file_(std::move(file)), path_(std::move(path)) {}

    bool read(char *buf, std::size_t cap, std::size_t &got,
              Error &err) override {
        std::string e;
        const long long n = file_->read(buf, cap, e);
        if (n < 0) {
            err = Error::make(ErrorKind::RemoteError, Side::Remote, path_, e);
            return false;
        }
        got = static_cast<std::size_t>(n);
        return true;
    }

private:
    std::unique_ptr<SftpFile> file_;
    std::string path_;
};

class SftpFileSink : public ByteSink {
public:
    SftpFileSink(std::unique_ptr<SftpFile> file, std::string path)
        : file_(std::move(file)), path_(std::move(path)) {}

    // SFTP writes may be short; loop until the chunk is gone.
    bool write(const char *data, std::size_t n, Error &err) override {
        std::size_t remain = n;
        while (remain > 0) {
            std::string e;
            const long long w = file_->write(data, remain, e);
            if (w < 0) {
                err = Error::make(ErrorKind::RemoteError, Side::Remote, path_, e);
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            data += w;
        }
        return true;
    }

    bool finish(Error &err) override {
        std::string e;
        if (!file_->close(e)) {
            err = Error::make(ErrorKind::RemoteError, Side::Remote, path_, e);
            return false;
        }
        return true;
    }

private:
    std::unique_ptr<SftpFile> file_;
    std::string path_;
};

} // namespace

RemoteFileSystem::RemoteFileSystem(SftpClient &client, std::string base)
    : client_(client), base_(std::move(base)) {
    if (base_.empty())
        base_ = ".";
}

std::string RemoteFileSystem::resolve(const std::string &path) const {
    if (path.empty() || path == ".")
        return base_;
    return joinPath(base_, path);
}

bool RemoteFileSystem::list(const std::string &dir, std::vector<FileInfo> &out,
                            Error &err) {
    std::string e;
    if (!client_.list(resolve(dir), out, e)) {
        FileInfo info;
        std::string statErr;
        const bool found = client_.stat(resolve(dir), info, statErr);
        err = Error::make(!found && statErr.empty() ? ErrorKind::RemoteNotFound
                                                    : ErrorKind::RemoteError,
                          Side::Remote, dir.empty() ? "." : dir, e);
        return false;
    }
    return true;
}

PathState RemoteFileSystem::probe(const std::string &path, std::uint64_t *size,
                                  Error &err) {
    FileInfo info;
    std::string e;
    if (!client_.stat(resolve(path), info, e)) {
        if (e.empty())
            return PathState::Missing;
        err = Error::make(ErrorKind::RemoteError, Side::Remote, path, e);
        return PathState::Unknown;
    }
    if (info.is_dir)
        return PathState::Directory;
    if (size)
        *size = info.size;
    return PathState::File;
}

bool RemoteFileSystem::makeDirectory(const std::string &path, Error &err) {
    std::string e;
    if (!client_.mkdir(resolve(path), e)) {
        err = Error::make(ErrorKind::RemoteError, Side::Remote, path, e);
        return false;
    }
    return true;
}

std::unique_ptr<ByteSource> RemoteFileSystem::openRead(const std::string &path,
                                                       Error &err) {
    std::string e;
    auto file = client_.openRead(resolve(path), e);
    if (!file) {
        err = Error::make(ErrorKind::RemoteError, Side::Remote, path, e);
        return nullptr;
    }
    return std::make_unique<SftpFileSource>(std::move(file), path);
}

std::unique_ptr<ByteSink> RemoteFileSystem::openWrite(const std::string &path,
                                                      Error &err) {
    std::string e;
    auto file = client_.openWrite(resolve(path), e);
    if (!file) {
        err = Error::make(ErrorKind::RemoteError, Side::Remote, path, e);
        return nullptr;
    }
    return std::make_unique<SftpFileSink>(std::move(file), path);
}

bool RemoteFileSystem::remove(const std::string &path, Error &err) {
    std::string e;
    if (!client_.removeFile(resolve(path), e)) {
        err = Error::make(ErrorKind::RemoteError, Side::Remote, path, e);
        return false;
    }
    return true;
}

} // namespace skiff
