#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <QString>

namespace qvs {

enum class ErrorKind {
    DeviceUnavailable,
    NoActiveRecording,
    FileNotFound,
    UnsupportedFormat,
    ModelLoadError,
    TranscriptionFailure,
    WriteError
};

/*! Error raised by the recording, transcription and output components.
 *
 *  The UI layer catches it and reports `title()` and `what()` to the user.
 */
class ScribeError : public std::runtime_error {
public:
    ScribeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_{kind} {}

    ScribeError(ErrorKind kind, const QString& message)
        : ScribeError(kind, message.toStdString()) {}

    ErrorKind kind() const noexcept { return kind_; }

    // Short, user facing heading for the error dialog
    QString title() const;

private:
    ErrorKind kind_;
};

std::string_view toName(ErrorKind kind);

} // ns

std::ostream& operator << (std::ostream& os, qvs::ErrorKind kind);
std::ostream& operator << (std::ostream& os, const qvs::ScribeError& err);
