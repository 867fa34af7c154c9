// Scoped ownership of one remote connection: whatever path a run takes, the
// destructor releases the session exactly once.
#pragma once
#include "skiff/Errors.hpp"
#include "skiff/SftpClient.hpp"
#include "skiff/Target.hpp"

#include <string>

namespace skiff {

class Connection {
public:
    explicit Connection(SftpClient &client);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Connects as target.principal to target.host and resolves the base
    // directory. Fails with ConnectionFailed, HostKeyRejected,
    // AuthenticationFailed or InvalidRemoteBase; a failed open leaves nothing
    // connected.
    bool open(const Target &target, const SessionOptions &base, Error &err);
    void close();

    bool isOpen() const { return open_; }
    SftpClient &client() { return client_; }
    // Absolute remote base directory.
    const std::string &baseDirectory() const { return base_; }

private:
    SftpClient &client_;
    bool open_ = false;
    std::string base_;
};

} // namespace skiff
