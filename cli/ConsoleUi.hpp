// Terminal interaction: prompts, progress and result lines. Prompts and
// progress go to stderr so stdout only carries paths or streamed data.
#pragma once
#include "skiff/TransferTypes.hpp"

#include <QString>

#include <cstdint>
#include <string>

namespace console {

// Prints `question` followed by " [y/N] " on stderr and reads one line from
// stdin. Anything but y/yes is a no, including end of input.
bool askYesNo(const QString &question);

// Trust-on-first-use prompt for a host missing from known_hosts.
bool confirmHostKey(const std::string &host, std::uint16_t port,
                    const std::string &algorithm,
                    const std::string &fingerprint);

void printOut(const QString &line);
void printErr(const QString &line);

// Rewrites one " NN%" line on stderr; the line is cleared when a file
// completes.
class ProgressPrinter {
public:
    void operator()(std::uint64_t done, std::uint64_t total);

private:
    int lastPercent_ = -1;
};

// Echoes destinations on stdout (unless quiet) and failures on stderr.
class OutcomePrinter {
public:
    OutcomePrinter(bool quiet, bool debug) : quiet_(quiet), debug_(debug) {}

    void operator()(const skiff::TransferOutcome &outcome) const;

private:
    bool quiet_;
    bool debug_;
};

} // namespace console
