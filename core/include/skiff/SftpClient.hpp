// Abstract interface for remote file operations. Concrete backends (libssh2,
// mock) implement this API so the transfer engine stays decoupled from them.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <memory>

namespace skiff {

// Open remote file handle. Closing is idempotent; the destructor closes too.
class SftpFile {
public:
    virtual ~SftpFile() = default;

    // Returns the number of bytes read, 0 at end of file, -1 on error.
    virtual long long read(char* buf, std::size_t len, std::string& err) = 0;

    // Returns the number of bytes written (possibly short), -1 on error.
    virtual long long write(const char* buf, std::size_t len, std::string& err) = 0;

    virtual bool close(std::string& err) = 0;
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect. On failure, `failure` (if given) tells which
    // stage refused the connection.
    virtual bool connect(const SessionOptions& opt,
                         std::string& err,
                         ConnectFailure* failure = nullptr) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." excluded).
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Metadata (stat, follows links). Returns true if the path exists.
    // Returns false with an empty err when it does not exist.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Canonical absolute form of a remote path.
    virtual bool realpath(const std::string& remote_path,
                          std::string& out,
                          std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    // Empty directories only. Transfers never remove folders; this is for
    // cleaning up after integration runs.
    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual std::unique_ptr<SftpFile> openRead(const std::string& remote_path,
                                               std::string& err) = 0;

    // Create or truncate.
    virtual std::unique_ptr<SftpFile> openWrite(const std::string& remote_path,
                                                std::string& err,
                                                unsigned int mode = 0644) = 0;
};

} // namespace skiff
