// Command-line surface: flags, positional arguments and their validation.
#pragma once
#include "skiff/SftpTypes.hpp"

#include <QString>
#include <QStringList>

#include <cstdint>

struct CliOptions {
    enum class Command { Transfer, ConfigPath, ConfigAdd, ConfigDelete, ConfigList };

    Command command = Command::Transfer;

    bool ask = false;
    bool binary = false;
    bool debug = false;
    bool force = false;
    bool caseInsensitive = false;
    bool keepHierarchy = false;
    bool list = false;
    bool move = false;
    bool noMatch = false;
    bool quiet = false;
    bool remote = false;
    bool stream = false;
    bool track = false;
    bool walk = false;

    bool hasExpr = false;
    QString expr;
    QString profile = QStringLiteral("default");
    QString url;
    QStringList paths;

    // Config subcommand arguments
    QString configUrl;
    QString configProfile;

    std::uint16_t port = 22;
    QString identity;
    QString knownHosts;
    skiff::KnownHostsPolicy hostKeyPolicy = skiff::KnownHostsPolicy::Strict;
};

enum class ParseStatus { Ok, Help, Version, Error };

// Does not exit: help and version are reported through the status, with the
// text to print in `text`. Errors also land in `text`.
ParseStatus parseCommandLine(const QStringList &arguments, CliOptions &out,
                             QString &text);
