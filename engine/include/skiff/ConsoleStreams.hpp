// Process stream endpoints for StreamMode transfers.
#pragma once
#include "skiff/FileSystem.hpp"

#include <QFile>
#include <QStringDecoder>
#include <QStringEncoder>

#include <cstdio>

namespace skiff {

// Reads raw bytes from a stdio stream (stdin by default).
class StandardInputSource : public ByteSource {
public:
    explicit StandardInputSource(FILE *stream = stdin);

    bool read(char *buf, std::size_t cap, std::size_t &got,
              Error &err) override;

private:
    QFile file_;
    bool opened_ = false;
};

// Writes raw bytes to a stdio stream (stdout by default).
class StandardOutputSink : public ByteSink {
public:
    explicit StandardOutputSink(FILE *stream = stdout);

    bool write(const char *data, std::size_t n, Error &err) override;
    bool finish(Error &err) override;

private:
    QFile file_;
    bool opened_ = false;
};

// Decodes bytes with the local preferred encoding before handing them to the
// console; undecodable or truncated input fails with DecodeError. The decoder
// is stateful, so a multi-byte sequence may straddle chunks.
class TextOutputSink : public ByteSink {
public:
    explicit TextOutputSink(ByteSink &console);

    bool write(const char *data, std::size_t n, Error &err) override;
    bool finish(Error &err) override;

private:
    ByteSink &console_;
    QStringDecoder decoder_;
    QStringEncoder encoder_;
};

} // namespace skiff
