// One filesystem capability with a local and a remote variant, so discovery
// and materialization are written once for both directions.
#pragma once
#include "skiff/Errors.hpp"
#include "skiff/SftpTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace skiff {

// Result of a stat-style probe. Unknown means the probe itself failed
// (permission denied, I/O error) and the error carries the reason.
enum class PathState { Missing, File, Directory, Unknown };

class ByteSource {
public:
    virtual ~ByteSource() = default;
    // got == 0 with a true return means end of data.
    virtual bool read(char *buf, std::size_t cap, std::size_t &got,
                      Error &err) = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;
    // Writes all n bytes or fails.
    virtual bool write(const char *data, std::size_t n, Error &err) = 0;
    // Flushes and closes; no write may follow.
    virtual bool finish(Error &err) = 0;
};

// Paths are relative to the filesystem root (local: a working directory,
// remote: the target base directory) unless absolute.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual Side side() const = 0;

    virtual bool list(const std::string &dir, std::vector<FileInfo> &out,
                      Error &err) = 0;
    // size is filled for files when non-null.
    virtual PathState probe(const std::string &path, std::uint64_t *size,
                            Error &err) = 0;
    virtual bool makeDirectory(const std::string &path, Error &err) = 0;
    virtual std::unique_ptr<ByteSource> openRead(const std::string &path,
                                                 Error &err) = 0;
    // Creates or truncates.
    virtual std::unique_ptr<ByteSink> openWrite(const std::string &path,
                                                Error &err) = 0;
    virtual bool remove(const std::string &path, Error &err) = 0;

    bool isDirectory(const std::string &path, Error &err) {
        return probe(path, nullptr, err) == PathState::Directory;
    }
    bool exists(const std::string &path, Error &err) {
        const PathState st = probe(path, nullptr, err);
        return st == PathState::File || st == PathState::Directory;
    }

protected:
    ErrorKind failureKind() const {
        return side() == Side::Remote ? ErrorKind::RemoteError
                                      : ErrorKind::LocalError;
    }
    ErrorKind notFoundKind() const {
        return side() == Side::Remote ? ErrorKind::RemoteNotFound
                                      : ErrorKind::LocalNotFound;
    }
};

// Joins with '/', treating "" and "." as the root.
std::string joinPath(const std::string &dir, const std::string &name);
// Parent part of a '/'-separated path ("" when there is none).
std::string parentPath(const std::string &path);
// Last component of a '/'-separated path.
std::string baseName(const std::string &path);

} // namespace skiff
