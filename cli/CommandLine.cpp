#include "CommandLine.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>

namespace {

const char *kDescription =
    "Transfer files to and from a remote host over SFTP.\n"
    "\n"
    "  skiff [-adfklmqrtw] [-p PROFILE | -u URL] ([-in] -e EXPR | FILEPATH ...)\n"
    "  skiff (-s | --stream) [-bdr] [-p PROFILE | -u URL] FILEPATH\n"
    "  skiff (-c | --config) [add URL [PROFILE] | delete PROFILE | list]\n"
    "\n"
    "Key authentication must be set up for each host. Urls have the form\n"
    "user@host:remote/path; save the ones you use often as profiles with\n"
    "`-c add URL PROFILE` and select them with `-p PROFILE`. Profiles live in\n"
    "$SKIFF_RC, or $HOME/.skiffrc when it is not set.";

bool parsePolicy(const QString &raw, skiff::KnownHostsPolicy &out) {
    const QString v = raw.trimmed().toLower();
    if (v == QLatin1String("strict"))
        out = skiff::KnownHostsPolicy::Strict;
    else if (v == QLatin1String("accept-new"))
        out = skiff::KnownHostsPolicy::AcceptNew;
    else if (v == QLatin1String("off"))
        out = skiff::KnownHostsPolicy::Off;
    else
        return false;
    return true;
}

} // namespace

ParseStatus parseCommandLine(const QStringList &arguments, CliOptions &out,
                             QString &text) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QString::fromLatin1(kDescription));
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsCompactedShortOptions);
    const QCommandLineOption help = parser.addHelpOption();
    const QCommandLineOption version = parser.addVersionOption();

    const QCommandLineOption ask({"a", "ask"}, "Ask before transferring each file.");
    const QCommandLineOption binary({"b", "binary"}, "Do not decode streamed output with the local encoding.");
    const QCommandLineOption config({"c", "config"}, "Configuration mode: add, delete or list profiles; prints the configuration path without a subcommand.");
    const QCommandLineOption debug({"d", "debug"}, "Print full error traces and debug logs.");
    const QCommandLineOption expr({"e", "expr"}, "Regular expression to filter file paths with.", "EXPR");
    const QCommandLineOption force({"f", "force"}, "Allow transferred files to overwrite existing ones.");
    const QCommandLineOption caseInsensitive({"i", "case-insensitive"}, "Case insensitive expression matching.");
    const QCommandLineOption keep({"k", "keep-hierarchy"}, "Preserve folder hierarchy instead of flattening into the destination folder.");
    const QCommandLineOption list({"l", "list"}, "Show matching file paths and exit without transferring.");
    const QCommandLineOption move({"m", "move"}, "Delete the source after a successful transfer.");
    const QCommandLineOption noMatch({"n", "no-match"}, "Inverse match.");
    const QCommandLineOption profile({"p", "profile"}, "Profile to use.", "PROFILE", "default");
    const QCommandLineOption quiet({"q", "quiet"}, "Do not print transferred file paths.");
    const QCommandLineOption remote({"r", "remote"}, "Remote mode: paths are on the remote host and transfers are downloads.");
    const QCommandLineOption stream({"s", "stream"}, "Stream mode: upload from stdin, or download to stdout with -r.");
    const QCommandLineOption track({"t", "track"}, "Show transfer progress on stderr.");
    const QCommandLineOption url({"u", "url"}, "Url to transfer to (overrides any profile).", "URL");
    const QCommandLineOption walk({"w", "walk"}, "Recursive directory exploration.");
    const QCommandLineOption port("port", "SSH port.", "PORT", "22");
    const QCommandLineOption identity("identity", "Private key file.", "KEY");
    const QCommandLineOption knownHosts("known-hosts", "known_hosts file (default: ~/.ssh/known_hosts).", "FILE");
    const QCommandLineOption hostKeyPolicy("host-key-policy", "strict, accept-new or off.", "POLICY", "strict");

    parser.addOptions({ask, binary, config, debug, expr, force, caseInsensitive,
                       keep, list, move, noMatch, profile, quiet, remote, stream,
                       track, url, walk, port, identity, knownHosts,
                       hostKeyPolicy});
    parser.addPositionalArgument("FILEPATH", "Local or remote path of a file to transfer. Directories are skipped.", "[FILEPATH...]");

    if (!parser.parse(arguments)) {
        text = parser.errorText();
        return ParseStatus::Error;
    }
    if (parser.isSet(help)) {
        text = parser.helpText();
        return ParseStatus::Help;
    }
    if (parser.isSet(version)) {
        text = QCoreApplication::applicationName() + QLatin1Char(' ') +
               QCoreApplication::applicationVersion();
        return ParseStatus::Version;
    }

    out.ask = parser.isSet(ask);
    out.binary = parser.isSet(binary);
    out.debug = parser.isSet(debug);
    out.force = parser.isSet(force);
    out.caseInsensitive = parser.isSet(caseInsensitive);
    out.keepHierarchy = parser.isSet(keep);
    out.list = parser.isSet(list);
    out.move = parser.isSet(move);
    out.noMatch = parser.isSet(noMatch);
    out.quiet = parser.isSet(quiet);
    out.remote = parser.isSet(remote);
    out.stream = parser.isSet(stream);
    out.track = parser.isSet(track);
    out.walk = parser.isSet(walk);
    out.hasExpr = parser.isSet(expr);
    out.expr = parser.value(expr);
    out.profile = parser.value(profile);
    out.url = parser.value(url);
    out.identity = parser.value(identity);
    out.knownHosts = parser.value(knownHosts);

    bool portOk = false;
    const uint portValue = parser.value(port).toUInt(&portOk);
    if (!portOk || portValue == 0 || portValue > 65535) {
        text = QStringLiteral("invalid port '%1'").arg(parser.value(port));
        return ParseStatus::Error;
    }
    out.port = static_cast<std::uint16_t>(portValue);
    if (!parsePolicy(parser.value(hostKeyPolicy), out.hostKeyPolicy)) {
        text = QStringLiteral("invalid host key policy '%1'")
                   .arg(parser.value(hostKeyPolicy));
        return ParseStatus::Error;
    }

    const QStringList positional = parser.positionalArguments();

    if (parser.isSet(config)) {
        const QString sub = positional.value(0);
        if (positional.isEmpty()) {
            out.command = CliOptions::Command::ConfigPath;
        } else if (sub == QLatin1String("add") &&
                   (positional.size() == 2 || positional.size() == 3)) {
            out.command = CliOptions::Command::ConfigAdd;
            out.configUrl = positional.at(1);
            out.configProfile = positional.value(2, QStringLiteral("default"));
        } else if (sub == QLatin1String("delete") && positional.size() <= 2) {
            out.command = CliOptions::Command::ConfigDelete;
            out.configProfile = positional.value(1, QStringLiteral("default"));
        } else if (sub == QLatin1String("list") && positional.size() == 1) {
            out.command = CliOptions::Command::ConfigList;
        } else {
            text = QStringLiteral("usage: skiff -c [add URL [PROFILE] | delete PROFILE | list]");
            return ParseStatus::Error;
        }
        return ParseStatus::Ok;
    }

    out.command = CliOptions::Command::Transfer;
    out.paths = positional;

    if (out.stream) {
        if (out.paths.size() != 1) {
            text = QStringLiteral("--stream takes exactly one FILEPATH");
            return ParseStatus::Error;
        }
        if (out.ask || out.hasExpr) {
            text = QStringLiteral("--stream cannot be combined with --ask or --expr");
            return ParseStatus::Error;
        }
        return ParseStatus::Ok;
    }
    if (out.hasExpr && !out.paths.isEmpty()) {
        text = QStringLiteral("give either --expr or FILEPATH arguments, not both");
        return ParseStatus::Error;
    }
    if (!out.hasExpr && out.paths.isEmpty()) {
        text = QStringLiteral("nothing to transfer: give --expr or FILEPATH arguments");
        return ParseStatus::Error;
    }
    if (!out.hasExpr && (out.caseInsensitive || out.noMatch || out.walk)) {
        text = QStringLiteral("--case-insensitive, --no-match and --walk require --expr");
        return ParseStatus::Error;
    }
    return ParseStatus::Ok;
}
