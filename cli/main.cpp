// Entry point: parse arguments, resolve the target, run one session.
#include "CommandLine.hpp"
#include "ConsoleUi.hpp"

#include "skiff/ConsoleStreams.hpp"
#include "skiff/Libssh2SftpClient.hpp"
#include "skiff/LocalFileSystem.hpp"
#include "skiff/Logging.hpp"
#include "skiff/ProfileStore.hpp"
#include "skiff/RuntimeLogging.hpp"
#include "skiff/Target.hpp"
#include "skiff/TransferSession.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

#include <cstdlib>
#include <memory>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

int reportError(const skiff::Error &err, bool debug) {
    const std::string text = debug ? err.trace() : err.message();
    console::printErr(QString::fromStdString(text).trimmed());
    return kExitFailure;
}

int runConfig(const CliOptions &opts, skiff::ProfileStore &store, bool debug) {
    skiff::Error err;
    switch (opts.command) {
    case CliOptions::Command::ConfigPath:
        console::printOut(QString::fromStdString(store.path()));
        return kExitOk;
    case CliOptions::Command::ConfigAdd:
        if (!store.add(opts.configProfile.toStdString(),
                       opts.configUrl.toStdString(), err))
            return reportError(err, debug);
        return kExitOk;
    case CliOptions::Command::ConfigDelete:
        if (!store.remove(opts.configProfile.toStdString(), err))
            return reportError(err, debug);
        return kExitOk;
    case CliOptions::Command::ConfigList: {
        std::vector<std::pair<std::string, std::string>> entries;
        if (!store.list(entries, err))
            return reportError(err, debug);
        for (const auto &e : entries) {
            console::printOut(QStringLiteral("%1 [%2]").arg(
                QString::fromStdString(e.first),
                QString::fromStdString(e.second)));
        }
        return kExitOk;
    }
    case CliOptions::Command::Transfer:
        break;
    }
    return kExitUsage;
}

// ~/.ssh identities in the order ssh tries them, when readable.
std::vector<std::string> defaultIdentities() {
    std::vector<std::string> out;
    const QDir ssh(QDir::home().filePath(QStringLiteral(".ssh")));
    for (const char *name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        const QFileInfo fi(ssh.filePath(QString::fromLatin1(name)));
        if (fi.isFile() && fi.isReadable())
            out.push_back(fi.absoluteFilePath().toStdString());
    }
    return out;
}

skiff::SessionOptions sessionOptions(const CliOptions &opts) {
    skiff::SessionOptions so;
    so.port = opts.port;
    if (!opts.identity.isEmpty())
        so.private_key_path = opts.identity.toStdString();
    if (!opts.knownHosts.isEmpty())
        so.known_hosts_path = opts.knownHosts.toStdString();
    so.known_hosts_policy = opts.hostKeyPolicy;
    so.default_identities = defaultIdentities();
    // A stream upload owns stdin, so nobody can answer a prompt.
    const bool stdinBusy = opts.stream && !opts.remote;
    if (opts.hostKeyPolicy == skiff::KnownHostsPolicy::AcceptNew && !stdinBusy)
        so.hostkey_confirm_cb = console::confirmHostKey;
    return so;
}

skiff::SessionRequest sessionRequest(const CliOptions &opts) {
    skiff::SessionRequest req;
    req.direction = opts.remote ? skiff::Direction::Download
                                : skiff::Direction::Upload;
    req.mode = opts.stream ? skiff::TransferMode::Stream
                           : skiff::TransferMode::File;
    req.policy.overwrite_allowed = opts.force;
    req.policy.preserve_hierarchy = opts.keepHierarchy;
    req.policy.delete_source_on_success = opts.move;
    req.policy.case_insensitive_match = opts.caseInsensitive;
    req.policy.invert_match = opts.noMatch;
    req.interactive = opts.ask;
    req.recursive = opts.walk;
    if (opts.hasExpr)
        req.pattern = opts.expr.toStdString();
    for (const QString &p : opts.paths)
        req.paths.push_back(p.toStdString());
    return req;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("skiff"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    CliOptions opts;
    QString text;
    switch (parseCommandLine(QCoreApplication::arguments(), opts, text)) {
    case ParseStatus::Help:
    case ParseStatus::Version:
        console::printOut(text.trimmed());
        return kExitOk;
    case ParseStatus::Error:
        console::printErr(QStringLiteral("error: ") + text);
        return kExitUsage;
    case ParseStatus::Ok:
        break;
    }

    const bool debug = opts.debug || skiff::debugEnvironmentEnabled();
    skiff::configureLogging(debug);

    skiff::ProfileStore store(skiff::ProfileStore::defaultPath());
    if (opts.command != CliOptions::Command::Transfer)
        return runConfig(opts, store, debug);

    skiff::Error err;
    skiff::Target target;
    if (!skiff::resolveTarget(opts.url.toStdString(), opts.profile.toStdString(),
                              store, target, err))
        return reportError(err, debug);

    const skiff::SessionOptions so = sessionOptions(opts);
    const skiff::SessionRequest request = sessionRequest(opts);

    skiff::Libssh2SftpClient client;
    skiff::LocalFileSystem local;
    skiff::TransferSession session(client, local);

    if (opts.list) {
        std::vector<skiff::TransferCandidate> candidates;
        if (!session.listCandidates(target, so, request, candidates, err))
            return reportError(err, debug);
        for (const auto &c : candidates)
            console::printOut(QString::fromStdString(c.relative_path));
        return kExitOk;
    }

    session.setConfirmer([](const std::string &path) {
        return console::askYesNo(
            QStringLiteral("Transfer %1?").arg(QString::fromStdString(path)));
    });
    session.setReporter(console::OutcomePrinter(opts.quiet, debug));
    if (opts.track && !opts.stream)
        session.setProgressCallback(console::ProgressPrinter());

    skiff::StandardInputSource stdinSource;
    skiff::StandardOutputSink stdoutSink;
    std::unique_ptr<skiff::TextOutputSink> textSink;
    if (opts.stream) {
        if (opts.remote) {
            if (opts.binary) {
                session.setStreamSink(&stdoutSink);
            } else {
                textSink = std::make_unique<skiff::TextOutputSink>(stdoutSink);
                session.setStreamSink(textSink.get());
            }
        } else {
            session.setStreamSource(&stdinSource);
        }
    }

    std::vector<skiff::TransferOutcome> outcomes;
    skiff::Error fatal;
    const bool completed = session.run(target, so, request, outcomes, fatal);
    // Candidates already report a fatal error that cut the run short.
    if (!completed && outcomes.empty())
        return reportError(fatal, debug);

    for (const auto &o : outcomes) {
        if (o.status == skiff::TransferOutcome::Status::Failed)
            return kExitFailure;
    }
    return completed ? kExitOk : kExitFailure;
}
