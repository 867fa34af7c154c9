#include "ConsoleUi.hpp"

#include <QTextStream>

#include <cstdio>

namespace console {

namespace {

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

// One reader for every prompt so buffered answers are not lost.
QTextStream &in() {
    static QTextStream s(stdin);
    return s;
}

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

} // namespace

bool askYesNo(const QString &question) {
    err() << question << " [y/N] " << Qt::flush;
    QString answer;
    if (!in().readLineInto(&answer))
        return false;
    answer = answer.trimmed().toLower();
    return answer == QLatin1String("y") || answer == QLatin1String("yes");
}

bool confirmHostKey(const std::string &host, std::uint16_t port,
                    const std::string &algorithm,
                    const std::string &fingerprint) {
    err() << QStringLiteral("The authenticity of host '%1:%2' can't be established.")
                 .arg(QString::fromStdString(host))
                 .arg(port)
          << Qt::endl
          << QStringLiteral("%1 key fingerprint is %2.")
                 .arg(QString::fromStdString(algorithm),
                      QString::fromStdString(fingerprint))
          << Qt::endl;
    return askYesNo(QStringLiteral("Trust this host and add it to known_hosts?"));
}

void printOut(const QString &line) { out() << line << Qt::endl; }

void printErr(const QString &line) { err() << line << Qt::endl; }

void ProgressPrinter::operator()(std::uint64_t done, std::uint64_t total) {
    // Empty files report (0, 0).
    const int percent =
        total == 0 ? 100 : static_cast<int>(done * 100 / total);
    if (percent != lastPercent_) {
        err() << QStringLiteral(" %1%").arg(percent, 3) << '\r' << Qt::flush;
        lastPercent_ = percent;
    }
    if (done == total) {
        err() << QStringLiteral("     ") << '\r' << Qt::flush;
        lastPercent_ = -1;
    }
}

void OutcomePrinter::operator()(const skiff::TransferOutcome &outcome) const {
    switch (outcome.status) {
    case skiff::TransferOutcome::Status::Succeeded:
        if (!quiet_ && outcome.destination)
            printOut(QString::fromStdString(*outcome.destination));
        if (!outcome.warning.empty())
            printErr(QString::fromStdString(outcome.warning));
        break;
    case skiff::TransferOutcome::Status::Skipped:
        break;
    case skiff::TransferOutcome::Status::Failed: {
        const std::string text =
            debug_ ? outcome.error.trace() : outcome.error.message();
        err() << QString::fromStdString(text);
        if (!debug_)
            err() << Qt::endl;
        err() << Qt::flush;
        break;
    }
    }
}

} // namespace console
