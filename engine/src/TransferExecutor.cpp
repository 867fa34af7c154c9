// Single-file transfer state machine: check source and destination, copy the
// bytes in fixed-size chunks, then optionally remove the source.
#include "skiff/TransferExecutor.hpp"
#include "skiff/Logging.hpp"

#include <QString>

#include <algorithm>
#include <vector>

namespace skiff {

namespace {

QString q(const std::string &s) { return QString::fromStdString(s); }

const char *kStdin = "<stdin>";

} // namespace

TransferExecutor::TransferExecutor(FileSystem &local, FileSystem &remote)
    : local_(local), remote_(remote) {}

bool TransferExecutor::checkSource(FileSystem &fs, const std::string &path,
                                   std::uint64_t &size, Error &err) {
    size = 0;
    switch (fs.probe(path, &size, err)) {
    case PathState::File:
        return true;
    case PathState::Missing:
        err = Error::make(fs.side() == Side::Remote ? ErrorKind::RemoteNotFound
                                                    : ErrorKind::LocalNotFound,
                          fs.side(), path);
        return false;
    case PathState::Directory:
        err = Error::make(ErrorKind::SourceIsDirectory, fs.side(), path);
        return false;
    case PathState::Unknown:
        break;
    }
    return false;
}

// Read and write strictly alternate; nothing is buffered beyond one chunk.
bool TransferExecutor::copy(ByteSource &from, ByteSink &to, std::size_t chunk,
                            std::uint64_t total, bool reportProgress,
                            Error &err) {
    std::vector<char> buf(chunk);
    std::uint64_t done = 0;
    std::uint64_t lastDone = 0;
    std::uint64_t lastTotal = 0;
    bool reported = false;
    const bool track = reportProgress && static_cast<bool>(progress_);

    while (true) {
        std::size_t got = 0;
        if (!from.read(buf.data(), buf.size(), got, err))
            return false;
        if (got == 0)
            break; // EOF
        if (!to.write(buf.data(), got, err))
            return false;
        done += got;
        if (track) {
            lastDone = done;
            lastTotal = std::max(total, done);
            reported = true;
            progress_(lastDone, lastTotal);
        }
    }
    if (track && (!reported || lastDone != done || lastTotal != done))
        progress_(done, done);
    return to.finish(err);
}

TransferOutcome TransferExecutor::execute(const TransferCandidate &candidate,
                                          const std::string &destination,
                                          Direction direction,
                                          TransferMode mode,
                                          const TransferPolicy &policy) {
    const std::string &source = candidate.relative_path;
    Error err;

    if (mode == TransferMode::Stream) {
        if (direction == Direction::Upload) {
            if (!streamSource_) {
                return TransferOutcome::failed(
                    kStdin, Error::make(ErrorKind::LocalError, Side::Local,
                                        kStdin, "no input stream bound"));
            }
            auto sink = remote_.openWrite(destination, err);
            if (!sink)
                return TransferOutcome::failed(kStdin, err);
            qCDebug(skXfer) << "streaming stdin to" << q(destination);
            if (!copy(*streamSource_, *sink, kStreamChunk, 0, false, err))
                return TransferOutcome::failed(kStdin, err);
            return TransferOutcome::succeeded(kStdin, destination);
        }

        std::uint64_t size = 0;
        if (!checkSource(remote_, source, size, err))
            return TransferOutcome::failed(source, err);
        if (!streamSink_) {
            return TransferOutcome::failed(
                source, Error::make(ErrorKind::LocalError, Side::Local,
                                    "<stdout>", "no output stream bound"));
        }
        auto reader = remote_.openRead(source, err);
        if (!reader)
            return TransferOutcome::failed(source, err);
        qCDebug(skXfer) << "streaming" << q(source) << "to stdout";
        if (!copy(*reader, *streamSink_, kStreamChunk, 0, false, err))
            return TransferOutcome::failed(source, err);
        reader.reset();
        TransferOutcome done = TransferOutcome::succeeded(source, std::nullopt);
        if (policy.delete_source_on_success && !remote_.remove(source, err)) {
            done.warning = err.message();
            qCInfo(skXfer) << "transfer succeeded but source was kept:"
                           << q(err.message());
        }
        return done;
    }

    FileSystem &from = direction == Direction::Upload ? local_ : remote_;
    FileSystem &to = direction == Direction::Upload ? remote_ : local_;

    // Checking
    std::uint64_t size = 0;
    if (!checkSource(from, source, size, err))
        return TransferOutcome::failed(source, err);
    if (!policy.overwrite_allowed) {
        switch (to.probe(destination, nullptr, err)) {
        case PathState::Missing:
            break;
        case PathState::File:
        case PathState::Directory:
            return TransferOutcome::failed(
                source,
                Error::make(ErrorKind::OverwriteRefused, to.side(), destination));
        case PathState::Unknown:
            return TransferOutcome::failed(source, err);
        }
    }

    // Writing
    auto reader = from.openRead(source, err);
    if (!reader)
        return TransferOutcome::failed(source, err);
    auto writer = to.openWrite(destination, err);
    if (!writer)
        return TransferOutcome::failed(source, err);
    qCDebug(skXfer) << directionName(direction) << q(source) << "->"
                    << q(destination) << size << "bytes";
    if (!copy(*reader, *writer, kFileChunk, size, true, err))
        return TransferOutcome::failed(source, err);
    reader.reset();
    writer.reset();

    // Finalizing
    TransferOutcome done = TransferOutcome::succeeded(source, destination);
    if (policy.delete_source_on_success && !from.remove(source, err)) {
        done.warning = err.message();
        qCInfo(skXfer) << "transfer succeeded but source was kept:"
                       << q(err.message());
    }
    return done;
}

} // namespace skiff
