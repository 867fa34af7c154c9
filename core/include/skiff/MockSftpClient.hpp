#pragma once
#include "SftpClient.hpp"
#include <map>
#include <set>

namespace skiff {

// In-memory remote filesystem. Paths are absolute once resolved; relative
// paths are taken from the home directory of the connected user.
class MockSftpClient : public SftpClient {
public:
  MockSftpClient();

  bool connect(const SessionOptions& opt,
               std::string& err,
               ConnectFailure* failure = nullptr) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }

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

  // Seeding and inspection (relative paths are taken from home).
  void setHome(const std::string& home) {
    home_ = home;
    addDir(home_);
  }
  const std::string& home() const { return home_; }
  void addDir(const std::string& path);
  void addFile(const std::string& path, const std::string& data);
  void addSymlinkToDir(const std::string& path);
  bool hasFile(const std::string& path) const;
  bool hasDir(const std::string& path) const;
  std::string fileData(const std::string& path) const;

  // Failure injection.
  void failNextConnect(ConnectFailure stage) { failConnect_ = stage; }
  void denyAccess(const std::string& path) { denied_.insert(normalize(path)); }
  void failRemoval(const std::string& path) { failRemove_.insert(normalize(path)); }
  // Opening this path drops the connection.
  void dropConnectionOn(const std::string& path) { dropOn_.insert(normalize(path)); }

  int connectCount() const { return connectCount_; }
  int disconnectCount() const { return disconnectCount_; }
  const SessionOptions& lastOptions() const { return lastOpt_; }

  std::string normalize(const std::string& path) const;

private:
  struct Node {
    bool is_dir = false;
    bool is_symlink = false;
    std::string data;
  };

  bool checkConnected(std::string& err) const;
  bool dropIfRequested(const std::string& abs, std::string& err);
  bool denied(const std::string& abs) const { return denied_.count(abs) != 0; }
  static std::string parentOf(const std::string& abs);
  static std::string baseName(const std::string& abs);

  bool connected_ = false;
  SessionOptions lastOpt_{};
  std::string home_ = "/home/alice";
  ConnectFailure failConnect_ = ConnectFailure::None;
  int connectCount_ = 0;
  int disconnectCount_ = 0;

  // absolute path -> node; "/" always present
  std::map<std::string, Node> fs_;
  std::set<std::string> denied_;
  std::set<std::string> failRemove_;
  std::set<std::string> dropOn_;

  friend class MockFile;
};

} // namespace skiff
