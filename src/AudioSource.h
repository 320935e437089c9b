#pragma once

#include <ostream>
#include <utility>

#include <QString>
#include <QStringList>

/*! A validated reference to the audio that is to be transcribed.
 *
 *  It is either a file we recorded ourself, or a file the user picked.
 *  Only recordings are owned by the session, and may be deleted by us.
 *  The content is not inspected here. Decoding is done by AudioDecoder.
 */
class AudioSource
{
public:
    enum class Origin {
        Recording,
        File
    };

    // Throws ScribeError (FileNotFound or UnsupportedFormat)
    static AudioSource fromRecording(const QString& path);
    static AudioSource fromFile(const QString& userPath);

    const QString& path() const noexcept { return path_; }
    Origin origin() const noexcept { return origin_; }
    bool isRecording() const noexcept { return origin_ == Origin::Recording; }

    // File name without directory and extension
    QString baseName() const;

    // Absolute path of the directory that contains the file
    QString directory() const;

    static const QStringList& supportedExtensions();

    // Filter for file dialogs, like "Audio files (*.mp3 *.wav ...)"
    static QString nameFilter();

    bool operator == (const AudioSource& other) const noexcept {
        return path_ == other.path_ && origin_ == other.origin_;
    }

private:
    AudioSource(QString path, Origin origin)
        : path_{std::move(path)}, origin_{origin} {}

    static AudioSource validate(const QString& path, Origin origin);

    QString path_;
    Origin origin_{Origin::File};
};

std::ostream& operator << (std::ostream& os, AudioSource::Origin origin);
