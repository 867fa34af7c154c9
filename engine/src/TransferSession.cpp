#include "skiff/TransferSession.hpp"
#include "skiff/Connection.hpp"
#include "skiff/Logging.hpp"
#include "skiff/PathDiscovery.hpp"
#include "skiff/PathMaterializer.hpp"
#include "skiff/RemoteFileSystem.hpp"
#include "skiff/TransferExecutor.hpp"

#include <QString>

namespace skiff {

namespace {

QString q(const std::string &s) { return QString::fromStdString(s); }

} // namespace

TransferSession::TransferSession(SftpClient &client, FileSystem &local)
    : client_(client), local_(local) {}

bool TransferSession::collect(RemoteFileSystem &remote,
                              const SessionRequest &request,
                              std::vector<TransferCandidate> &out,
                              Error &err) {
    if (request.mode == TransferMode::Stream) {
        // In stream mode an upload path names the remote destination, so no
        // local directory filtering applies.
        out.clear();
        for (const auto &p : request.paths)
            out.push_back(TransferCandidate{p, false});
        return true;
    }
    if (!request.pattern) {
        out = explicitCandidates(request.paths, request.direction, local_);
        return true;
    }
    DiscoveryOptions opts;
    opts.recursive = request.recursive;
    opts.case_insensitive = request.policy.case_insensitive_match;
    opts.invert = request.policy.invert_match;
    FileSystem &fs = request.direction == Direction::Download
                         ? static_cast<FileSystem &>(remote)
                         : local_;
    return discover(fs, ".", request.pattern, opts, out, err);
}

void TransferSession::record(std::vector<TransferOutcome> &outcomes,
                             TransferOutcome outcome) {
    switch (outcome.status) {
    case TransferOutcome::Status::Succeeded:
        qCInfo(skSession) << "transferred" << q(outcome.source);
        break;
    case TransferOutcome::Status::Skipped:
        qCInfo(skSession) << "skipped" << q(outcome.source) << q(outcome.reason);
        break;
    case TransferOutcome::Status::Failed:
        qCInfo(skSession) << "failed" << q(outcome.source)
                          << errorKindName(outcome.error.kind);
        break;
    }
    if (report_)
        report_(outcome);
    outcomes.push_back(std::move(outcome));
}

bool TransferSession::listCandidates(const Target &target,
                                     const SessionOptions &options,
                                     const SessionRequest &request,
                                     std::vector<TransferCandidate> &out,
                                     Error &err) {
    Connection conn(client_);
    if (!conn.open(target, options, err))
        return false;
    RemoteFileSystem remote(client_, conn.baseDirectory());
    return collect(remote, request, out, err);
}

bool TransferSession::run(const Target &target, const SessionOptions &options,
                          const SessionRequest &request,
                          std::vector<TransferOutcome> &outcomes,
                          Error &fatal) {
    outcomes.clear();
    fatal = Error{};
    Connection conn(client_);
    if (!conn.open(target, options, fatal))
        return false;
    RemoteFileSystem remote(client_, conn.baseDirectory());

    std::vector<TransferCandidate> candidates;
    if (!collect(remote, request, candidates, fatal))
        return false;
    qCDebug(skSession) << directionName(request.direction) << "of"
                       << candidates.size() << "candidates";

    // Every question is asked before any byte moves.
    std::vector<bool> confirmed(candidates.size(), true);
    if (request.interactive && confirm_) {
        for (std::size_t i = 0; i < candidates.size(); ++i)
            confirmed[i] = confirm_(candidates[i].relative_path);
    }

    PathMaterializer materializer(local_, remote);
    TransferExecutor executor(local_, remote);
    if (request.mode == TransferMode::File)
        executor.setProgressCallback(progress_);
    executor.setStreamSource(streamSource_);
    executor.setStreamSink(streamSink_);

    bool stdinConsumed = false;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const TransferCandidate &candidate = candidates[i];
        if (fatal.kind != ErrorKind::None) {
            record(outcomes, TransferOutcome::failed(candidate.relative_path, fatal));
            continue;
        }
        if (!confirmed[i]) {
            record(outcomes, TransferOutcome::skipped(candidate.relative_path,
                                                      "declined"));
            continue;
        }

        std::string destination = candidate.relative_path;
        if (request.mode == TransferMode::Stream &&
            request.direction == Direction::Upload) {
            if (stdinConsumed) {
                record(outcomes,
                       TransferOutcome::skipped(candidate.relative_path,
                                                "standard input already consumed"));
                continue;
            }
            stdinConsumed = true;
        }

        TransferOutcome outcome;
        Error err;
        if (request.mode == TransferMode::File &&
            !materializer.materialize(candidate, request.direction,
                                      request.policy, destination, err)) {
            outcome = TransferOutcome::failed(candidate.relative_path, err);
        } else {
            outcome = executor.execute(candidate, destination, request.direction,
                                       request.mode, request.policy);
        }
        const bool lost = !outcome.ok() && !client_.isConnected();
        record(outcomes, std::move(outcome));
        if (lost) {
            fatal = Error::make(ErrorKind::ConnectionFailed, Side::Remote,
                                target.principal + "@" + target.host,
                                "connection lost during transfer");
            conn.close();
        }
    }
    return fatal.kind == ErrorKind::None;
}

} // namespace skiff
