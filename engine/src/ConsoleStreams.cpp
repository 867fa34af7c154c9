#include "skiff/ConsoleStreams.hpp"

#include <QByteArray>
#include <QByteArrayView>
#include <QString>

namespace skiff {

StandardInputSource::StandardInputSource(FILE *stream) {
    opened_ = file_.open(stream, QIODevice::ReadOnly | QIODevice::Unbuffered);
}

bool StandardInputSource::read(char *buf, std::size_t cap, std::size_t &got,
                               Error &err) {
    if (!opened_) {
        err = Error::make(ErrorKind::LocalError, Side::Local, "<stdin>",
                          "standard input is not available");
        return false;
    }
    const qint64 n = file_.read(buf, static_cast<qint64>(cap));
    if (n < 0) {
        err = Error::make(ErrorKind::LocalError, Side::Local, "<stdin>",
                          file_.errorString().toStdString());
        return false;
    }
    got = static_cast<std::size_t>(n);
    return true;
}

StandardOutputSink::StandardOutputSink(FILE *stream) {
    opened_ = file_.open(stream, QIODevice::WriteOnly | QIODevice::Unbuffered);
}

bool StandardOutputSink::write(const char *data, std::size_t n, Error &err) {
    if (!opened_ ||
        file_.write(data, static_cast<qint64>(n)) != static_cast<qint64>(n)) {
        err = Error::make(ErrorKind::LocalError, Side::Local, "<stdout>",
                          opened_ ? file_.errorString().toStdString()
                                  : "standard output is not available");
        return false;
    }
    return true;
}

bool StandardOutputSink::finish(Error &err) {
    if (opened_ && !file_.flush()) {
        err = Error::make(ErrorKind::LocalError, Side::Local, "<stdout>",
                          file_.errorString().toStdString());
        return false;
    }
    return true;
}

TextOutputSink::TextOutputSink(ByteSink &console)
    : console_(console), decoder_(QStringConverter::System),
      encoder_(QStringConverter::System) {}

bool TextOutputSink::write(const char *data, std::size_t n, Error &err) {
    const QString text =
        decoder_.decode(QByteArrayView(data, static_cast<qsizetype>(n)));
    if (decoder_.hasError()) {
        err = Error::make(ErrorKind::DecodeError, Side::Local, "<stdout>",
                          "input is not valid in the local encoding");
        return false;
    }
    const QByteArray out = encoder_.encode(text);
    return console_.write(out.constData(), static_cast<std::size_t>(out.size()),
                          err);
}

bool TextOutputSink::finish(Error &err) {
    // A sequence cut off by the end of the stream is still in the decoder
    // state; a plain terminator makes it show up as invalid.
    const QString rest = decoder_.decode(QByteArrayView("\n", 1));
    if (decoder_.hasError()) {
        err = Error::make(ErrorKind::DecodeError, Side::Local, "<stdout>",
                          "input ends inside a multi-byte sequence");
        return false;
    }
    Q_UNUSED(rest);
    return console_.finish(err);
}

} // namespace skiff
