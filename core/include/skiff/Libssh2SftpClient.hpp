#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of the INTERNAL libssh2 types (leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace skiff {

class Libssh2SftpClient : public SftpClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

  Libssh2SftpClient(const Libssh2SftpClient&) = delete;
  Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

  bool connect(const SessionOptions& opt,
               std::string& err,
               ConnectFailure* failure = nullptr) override;
  void disconnect() override;
  // False once the socket under the session has failed.
  bool isConnected() const override;

  bool list(const std::string& remote_path,
            std::vector<FileInfo>& out,
            std::string& err) override;

  bool stat(const std::string& remote_path,
            FileInfo& info,
            std::string& err) override;

  bool realpath(const std::string& remote_path,
                std::string& out,
                std::string& err) override;

  bool mkdir(const std::string& remote_dir,
             std::string& err,
             unsigned int mode = 0755) override;

  bool removeFile(const std::string& remote_path,
                  std::string& err) override;
  bool removeDir(const std::string& remote_dir,
                 std::string& err) override;

  std::unique_ptr<SftpFile> openRead(const std::string& remote_path,
                                     std::string& err) override;

  std::unique_ptr<SftpFile> openWrite(const std::string& remote_path,
                                      std::string& err,
                                      unsigned int mode = 0644) override;

private:
  bool connected_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr; // <- internal types
  _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same

  bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
  bool verifyHostKey(const SessionOptions& opt, std::string& err);
  bool authenticate(const SessionOptions& opt, std::string& err);
  bool authenticateWithAgent(const std::string& user);
  std::string lastSessionError() const;
};

} // namespace skiff
