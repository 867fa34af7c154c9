#include "skiff/MockSftpClient.hpp"
#include <algorithm>
#include <vector>

namespace skiff {

class MockFile : public SftpFile {
public:
  MockFile(MockSftpClient* owner, std::string path, bool writable)
      : owner_(owner), path_(std::move(path)), writable_(writable) {}

  long long read(char* buf, std::size_t len, std::string& err) override {
    auto it = owner_->fs_.find(path_);
    if (closed_ || writable_ || it == owner_->fs_.end()) {
      err = "Mock: file not readable: " + path_;
      return -1;
    }
    const std::string& data = it->second.data;
    if (offset_ >= data.size()) return 0;
    const std::size_t n = std::min(len, data.size() - offset_);
    std::copy(data.begin() + offset_, data.begin() + offset_ + n, buf);
    offset_ += n;
    return (long long)n;
  }

  long long write(const char* buf, std::size_t len, std::string& err) override {
    auto it = owner_->fs_.find(path_);
    if (closed_ || !writable_ || it == owner_->fs_.end()) {
      err = "Mock: file not writable: " + path_;
      return -1;
    }
    it->second.data.append(buf, len);
    return (long long)len;
  }

  bool close(std::string&) override {
    closed_ = true;
    return true;
  }

private:
  MockSftpClient* owner_;
  std::string path_;
  bool writable_;
  bool closed_ = false;
  std::size_t offset_ = 0;
};

MockSftpClient::MockSftpClient() {
  fs_["/"] = Node{true, false, {}};
  addDir(home_);
}

std::string MockSftpClient::normalize(const std::string& path) const {
  std::string full = (!path.empty() && path[0] == '/') ? path : home_ + "/" + path;
  std::vector<std::string> parts;
  std::size_t pos = 0;
  while (pos <= full.size()) {
    std::size_t next = full.find('/', pos);
    if (next == std::string::npos) next = full.size();
    const std::string part = full.substr(pos, next - pos);
    if (part == "..") {
      if (!parts.empty()) parts.pop_back();
    } else if (!part.empty() && part != ".") {
      parts.push_back(part);
    }
    pos = next + 1;
  }
  std::string out;
  for (const auto& p : parts) out += "/" + p;
  return out.empty() ? "/" : out;
}

std::string MockSftpClient::parentOf(const std::string& abs) {
  const auto slash = abs.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return "/";
  return abs.substr(0, slash);
}

std::string MockSftpClient::baseName(const std::string& abs) {
  const auto slash = abs.find_last_of('/');
  return slash == std::string::npos ? abs : abs.substr(slash + 1);
}

bool MockSftpClient::dropIfRequested(const std::string& abs, std::string& err) {
  if (!dropOn_.count(abs)) return false;
  connected_ = false;
  err = "Mock: connection lost";
  return true;
}

void MockSftpClient::addDir(const std::string& path) {
  const std::string abs = normalize(path);
  if (abs != "/") addDir(parentOf(abs));
  auto& node = fs_[abs];
  node.is_dir = true;
}

void MockSftpClient::addFile(const std::string& path, const std::string& data) {
  const std::string abs = normalize(path);
  addDir(parentOf(abs));
  fs_[abs] = Node{false, false, data};
}

void MockSftpClient::addSymlinkToDir(const std::string& path) {
  const std::string abs = normalize(path);
  addDir(parentOf(abs));
  fs_[abs] = Node{true, true, {}};
}

bool MockSftpClient::hasFile(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  return it != fs_.end() && !it->second.is_dir;
}

bool MockSftpClient::hasDir(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  return it != fs_.end() && it->second.is_dir;
}

std::string MockSftpClient::fileData(const std::string& path) const {
  auto it = fs_.find(normalize(path));
  return it == fs_.end() ? std::string() : it->second.data;
}

bool MockSftpClient::checkConnected(std::string& err) const {
  if (!connected_) {
    err = "Not connected";
    return false;
  }
  return true;
}

bool MockSftpClient::connect(const SessionOptions& opt,
                             std::string& err,
                             ConnectFailure* failure) {
  ++connectCount_;
  if (failure) *failure = ConnectFailure::None;
  if (opt.host.empty() || opt.username.empty()) {
    err = "Host and user are required";
    if (failure) *failure = ConnectFailure::Network;
    return false;
  }
  if (failConnect_ != ConnectFailure::None) {
    err = "Mock: connection refused";
    if (failure) *failure = failConnect_;
    failConnect_ = ConnectFailure::None;
    return false;
  }
  connected_ = true;
  lastOpt_ = opt;
  return true;
}

void MockSftpClient::disconnect() {
  if (connected_) ++disconnectCount_;
  connected_ = false;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
  if (!checkConnected(err)) return false;
  const std::string abs = normalize(remote_path.empty() ? "." : remote_path);

  auto it = fs_.find(abs);
  if (it == fs_.end() || !it->second.is_dir || denied(abs)) {
    err = "Mock: remote path not listable: " + abs;
    return false;
  }
  out.clear();
  for (const auto& kv : fs_) {
    if (kv.first == abs || parentOf(kv.first) != abs) continue;
    FileInfo fi;
    fi.name = baseName(kv.first);
    fi.is_dir = kv.second.is_dir;
    fi.is_symlink = kv.second.is_symlink;
    fi.size = kv.second.data.size();
    out.push_back(std::move(fi));
  }
  // Servers return entries in no particular order; mimic that.
  std::reverse(out.begin(), out.end());
  return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
  if (!checkConnected(err)) return false;
  const std::string abs = normalize(remote_path);
  if (denied(abs)) {
    err = "Mock: permission denied: " + abs;
    return false;
  }
  auto it = fs_.find(abs);
  if (it == fs_.end()) {
    err.clear();
    return false;
  }
  info = FileInfo{};
  info.name = baseName(abs);
  info.is_dir = it->second.is_dir;
  info.is_symlink = it->second.is_symlink;
  info.size = it->second.data.size();
  return true;
}

bool MockSftpClient::realpath(const std::string& remote_path,
                              std::string& out,
                              std::string& err) {
  if (!checkConnected(err)) return false;
  const std::string abs = normalize(remote_path.empty() ? "." : remote_path);
  if (fs_.find(abs) == fs_.end()) {
    err = "Mock: no such path: " + abs;
    return false;
  }
  out = abs;
  return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           std::string& err,
                           unsigned int) {
  if (!checkConnected(err)) return false;
  const std::string abs = normalize(remote_dir);
  auto parent = fs_.find(parentOf(abs));
  if (fs_.count(abs) || parent == fs_.end() || !parent->second.is_dir ||
      denied(abs)) {
    err = "Mock: mkdir failed: " + abs;
    return false;
  }
  fs_[abs] = Node{true, false, {}};
  return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                std::string& err) {
  if (!checkConnected(err)) return false;
  const std::string abs = normalize(remote_path);
  auto it = fs_.find(abs);
  if (it == fs_.end() || it->second.is_dir || failRemove_.count(abs)) {
    err = "Mock: unlink failed: " + abs;
    return false;
  }
  fs_.erase(it);
  return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir,
                               std::string& err) {
  if (!checkConnected(err)) return false;
  const std::string abs = normalize(remote_dir);
  auto it = fs_.find(abs);
  bool empty = true;
  for (const auto& kv : fs_) {
    if (kv.first != abs && parentOf(kv.first) == abs) {
      empty = false;
      break;
    }
  }
  if (abs == "/" || it == fs_.end() || !it->second.is_dir || !empty) {
    err = "Mock: rmdir failed: " + abs;
    return false;
  }
  fs_.erase(it);
  return true;
}

std::unique_ptr<SftpFile> MockSftpClient::openRead(const std::string& remote_path,
                                                   std::string& err) {
  if (!checkConnected(err)) return nullptr;
  const std::string abs = normalize(remote_path);
  if (dropIfRequested(abs, err)) return nullptr;
  auto it = fs_.find(abs);
  if (it == fs_.end() || it->second.is_dir || denied(abs)) {
    err = "Mock: cannot open for reading: " + abs;
    return nullptr;
  }
  return std::make_unique<MockFile>(this, abs, false);
}

std::unique_ptr<SftpFile> MockSftpClient::openWrite(const std::string& remote_path,
                                                    std::string& err,
                                                    unsigned int) {
  if (!checkConnected(err)) return nullptr;
  const std::string abs = normalize(remote_path);
  if (dropIfRequested(abs, err)) return nullptr;
  auto parent = fs_.find(parentOf(abs));
  auto it = fs_.find(abs);
  if ((it != fs_.end() && it->second.is_dir) || parent == fs_.end() ||
      !parent->second.is_dir || denied(abs)) {
    err = "Mock: cannot open for writing: " + abs;
    return nullptr;
  }
  fs_[abs] = Node{false, false, {}};
  return std::make_unique<MockFile>(this, abs, true);
}

} // namespace skiff
