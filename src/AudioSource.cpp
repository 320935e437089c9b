#include <array>
#include <ostream>

#include <QFileInfo>
#include <QDir>

#include "AudioSource.h"
#include "ScribeError.h"

#include "logging.h"

using namespace std;

ostream& operator << (ostream& os, AudioSource::Origin origin)
{
    constexpr auto names = to_array<string_view>({
        "Recording",
        "File"
    });

    return os << names.at(static_cast<size_t>(origin));
}

AudioSource AudioSource::fromRecording(const QString &path)
{
    return validate(path, Origin::Recording);
}

AudioSource AudioSource::fromFile(const QString &userPath)
{
    return validate(userPath, Origin::File);
}

QString AudioSource::baseName() const
{
    return QFileInfo{path_}.completeBaseName();
}

QString AudioSource::directory() const
{
    return QFileInfo{path_}.absolutePath();
}

const QStringList &AudioSource::supportedExtensions()
{
    static const QStringList extensions{"mp3", "wav", "flac", "ogg"};
    return extensions;
}

QString AudioSource::nameFilter()
{
    QStringList patterns;
    for(const auto& ext : supportedExtensions()) {
        patterns.append(QStringLiteral("*.") + ext);
    }

    return QStringLiteral("Audio files (%1)").arg(patterns.join(' '));
}

AudioSource AudioSource::validate(const QString &path, Origin origin)
{
    using qvs::ErrorKind;
    using qvs::ScribeError;

    const QFileInfo fi{path};
    if (path.trimmed().isEmpty() || !fi.exists() || fi.isDir()) {
        LOG_DEBUG_N << "Rejecting " << origin << " '" << path << "': not found";
        throw ScribeError{ErrorKind::FileNotFound,
                          QStringLiteral("Audio file not found: %1").arg(path)};
    }

    const auto ext = fi.suffix().toLower();
    if (!supportedExtensions().contains(ext)) {
        LOG_DEBUG_N << "Rejecting " << origin << " '" << path << "': unsupported extension";
        throw ScribeError{ErrorKind::UnsupportedFormat,
                          QStringLiteral("Unsupported audio format '%1'. Supported formats are: %2")
                              .arg(fi.suffix(), supportedExtensions().join(", "))};
    }

    return AudioSource{QDir::cleanPath(fi.absoluteFilePath()), origin};
}
