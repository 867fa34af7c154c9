#pragma once
#include "skiff/FileSystem.hpp"
#include "skiff/SftpClient.hpp"

namespace skiff {

// Remote files through an SftpClient, rooted at the target base directory.
// The client is not owned and must stay connected while this is in use.
class RemoteFileSystem : public FileSystem {
public:
    RemoteFileSystem(SftpClient &client, std::string base);

    Side side() const override { return Side::Remote; }
    const std::string &base() const { return base_; }

    bool list(const std::string &dir, std::vector<FileInfo> &out,
              Error &err) override;
    PathState probe(const std::string &path, std::uint64_t *size,
                    Error &err) override;
    bool makeDirectory(const std::string &path, Error &err) override;
    std::unique_ptr<ByteSource> openRead(const std::string &path,
                                         Error &err) override;
    std::unique_ptr<ByteSink> openWrite(const std::string &path,
                                        Error &err) override;
    bool remove(const std::string &path, Error &err) override;

private:
    std::string resolve(const std::string &path) const;

    SftpClient &client_;
    std::string base_;
};

} // namespace skiff
