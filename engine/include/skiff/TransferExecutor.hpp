// Moves the bytes of one candidate in one direction.
#pragma once
#include "skiff/FileSystem.hpp"
#include "skiff/TransferTypes.hpp"

#include <cstddef>

namespace skiff {

class TransferExecutor {
public:
    static constexpr std::size_t kFileChunk = 64 * 1024;
    static constexpr std::size_t kStreamChunk = 32 * 1024;

    TransferExecutor(FileSystem &local, FileSystem &remote);

    // FileMode only; never called for streams.
    void setProgressCallback(ProgressCallback cb) { progress_ = std::move(cb); }
    // StreamMode endpoints (stdin for uploads, stdout for downloads). Not owned.
    void setStreamSource(ByteSource *source) { streamSource_ = source; }
    void setStreamSink(ByteSink *sink) { streamSink_ = sink; }

    // Checking -> Writing -> Finalizing. For StreamMode uploads `destination`
    // is the remote path; for StreamMode downloads it is ignored.
    TransferOutcome execute(const TransferCandidate &candidate,
                            const std::string &destination, Direction direction,
                            TransferMode mode, const TransferPolicy &policy);

private:
    bool checkSource(FileSystem &fs, const std::string &path,
                     std::uint64_t &size, Error &err);
    bool copy(ByteSource &from, ByteSink &to, std::size_t chunk,
              std::uint64_t total, bool reportProgress, Error &err);

    FileSystem &local_;
    FileSystem &remote_;
    ProgressCallback progress_;
    ByteSource *streamSource_ = nullptr;
    ByteSink *streamSink_ = nullptr;
};

} // namespace skiff
