// Runs one invocation: connect once, collect candidates, confirm them up
// front, then materialize and execute each in order.
#pragma once
#include "skiff/FileSystem.hpp"
#include "skiff/SftpClient.hpp"
#include "skiff/Target.hpp"
#include "skiff/TransferTypes.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skiff {

class Connection;
class RemoteFileSystem;

struct SessionRequest {
    Direction direction = Direction::Upload;
    TransferMode mode = TransferMode::File;
    TransferPolicy policy;
    bool interactive = false;
    bool recursive = false;
    // Either a pattern (discovery) or explicit paths; stream mode only uses
    // explicit paths.
    std::optional<std::string> pattern;
    std::vector<std::string> paths;
};

class TransferSession {
public:
    using Confirmer = std::function<bool(const std::string &path)>;
    using Reporter = std::function<void(const TransferOutcome &)>;

    // The client is not owned; the session connects and releases it per run.
    TransferSession(SftpClient &client, FileSystem &local);

    void setConfirmer(Confirmer c) { confirm_ = std::move(c); }
    // Called once per outcome, as soon as it is known.
    void setReporter(Reporter r) { report_ = std::move(r); }
    void setProgressCallback(ProgressCallback cb) { progress_ = std::move(cb); }
    void setStreamSource(ByteSource *source) { streamSource_ = source; }
    void setStreamSink(ByteSink *sink) { streamSink_ = sink; }

    // Both result holders are reset on entry. Returns false with `fatal` set
    // when the run could not start or lost its connection; outcomes gathered
    // so far are kept, and every candidate still yields exactly one outcome.
    bool run(const Target &target, const SessionOptions &options,
             const SessionRequest &request,
             std::vector<TransferOutcome> &outcomes, Error &fatal);

    // Candidates a run would consider, without transferring anything.
    bool listCandidates(const Target &target, const SessionOptions &options,
                        const SessionRequest &request,
                        std::vector<TransferCandidate> &out, Error &err);

private:
    bool collect(RemoteFileSystem &remote, const SessionRequest &request,
                 std::vector<TransferCandidate> &out, Error &err);
    void record(std::vector<TransferOutcome> &outcomes, TransferOutcome outcome);

    SftpClient &client_;
    FileSystem &local_;
    Confirmer confirm_;
    Reporter report_;
    ProgressCallback progress_;
    ByteSource *streamSource_ = nullptr;
    ByteSink *streamSink_ = nullptr;
};

} // namespace skiff
