#include "skiff/Connection.hpp"
#include "skiff/Logging.hpp"

#include <QString>

namespace skiff {

Connection::Connection(SftpClient &client) : client_(client) {}

Connection::~Connection() { close(); }

bool Connection::open(const Target &target, const SessionOptions &base,
                      Error &err) {
    close();
    SessionOptions opt = base;
    opt.host = target.host;
    opt.username = target.principal;
    const std::string who = target.principal + "@" + target.host;

    std::string e;
    ConnectFailure failure = ConnectFailure::None;
    qCDebug(skSession) << "connecting to" << QString::fromStdString(who)
                       << "port" << opt.port;
    if (!client_.connect(opt, e, &failure)) {
        switch (failure) {
        case ConnectFailure::HostKey:
            err = Error::make(ErrorKind::HostKeyRejected, Side::Remote,
                              target.host, e);
            break;
        case ConnectFailure::Authentication:
            err = Error::make(ErrorKind::AuthenticationFailed, Side::Remote,
                              who, e);
            break;
        default:
            err = Error::make(ErrorKind::ConnectionFailed, Side::Remote, who, e);
            break;
        }
        client_.disconnect();
        return false;
    }
    open_ = true;

    std::string resolved;
    FileInfo info;
    if (!client_.realpath(target.base_directory, resolved, e) ||
        !client_.stat(resolved, info, e) || !info.is_dir) {
        err = Error::make(ErrorKind::InvalidRemoteBase, Side::Remote,
                          target.base_directory,
                          e.empty() ? "not a directory" : e);
        close();
        return false;
    }
    base_ = resolved;
    qCInfo(skSession) << "connected to" << QString::fromStdString(who)
                      << "in" << QString::fromStdString(base_);
    return true;
}

void Connection::close() {
    if (!open_)
        return;
    client_.disconnect();
    open_ = false;
    base_.clear();
    qCDebug(skSession) << "connection released";
}

} // namespace skiff
