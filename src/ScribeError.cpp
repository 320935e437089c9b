#include <array>

#include <QCoreApplication>

#include "ScribeError.h"

using namespace std;

namespace qvs {

string_view toName(ErrorKind kind)
{
    constexpr auto names = to_array<string_view>({
        "DeviceUnavailable",
        "NoActiveRecording",
        "FileNotFound",
        "UnsupportedFormat",
        "ModelLoadError",
        "TranscriptionFailure",
        "WriteError"
    });

    return names.at(static_cast<size_t>(kind));
}

QString ScribeError::title() const
{
    switch(kind_) {
    case ErrorKind::DeviceUnavailable:
        return QCoreApplication::translate("ScribeError", "Audio Error");
    case ErrorKind::NoActiveRecording:
        return QCoreApplication::translate("ScribeError", "Recording Error");
    case ErrorKind::FileNotFound:
        return QCoreApplication::translate("ScribeError", "File Not Found");
    case ErrorKind::UnsupportedFormat:
        return QCoreApplication::translate("ScribeError", "Unsupported Format");
    case ErrorKind::ModelLoadError:
        return QCoreApplication::translate("ScribeError", "Model Error");
    case ErrorKind::TranscriptionFailure:
        return QCoreApplication::translate("ScribeError", "Transcription Error");
    case ErrorKind::WriteError:
        return QCoreApplication::translate("ScribeError", "Save Error");
    }

    return QCoreApplication::translate("ScribeError", "Error");
}

} // ns

ostream& operator << (ostream& os, qvs::ErrorKind kind)
{
    return os << qvs::toName(kind);
}

ostream& operator << (ostream& os, const qvs::ScribeError& err)
{
    return os << err.kind() << ": " << err.what();
}
