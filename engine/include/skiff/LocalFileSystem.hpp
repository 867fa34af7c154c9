#pragma once
#include "skiff/FileSystem.hpp"

#include <QString>

namespace skiff {

// Local files through QDir/QFile, rooted at a working directory.
class LocalFileSystem : public FileSystem {
public:
    explicit LocalFileSystem(std::string root = ".");

    Side side() const override { return Side::Local; }
    const std::string &root() const { return root_; }

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
    QString resolve(const std::string &path) const;

    std::string root_;
};

} // namespace skiff
