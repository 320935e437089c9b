#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include "OutputManager.h"
#include "ScribeError.h"
#include "Session.h"
#include "logging.h"

using namespace std;

void OutputManager::save(const QString &text, const QString &destinationPath)
{
    if (destinationPath.isEmpty()) {
        throw qvs::ScribeError{qvs::ErrorKind::WriteError, string{"No destination file was given."}};
    }

    QSaveFile file{destinationPath};
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_WARN_N << "Failed to open " << destinationPath << " for writing: " << file.errorString();
        throw qvs::ScribeError{qvs::ErrorKind::WriteError,
                               QStringLiteral("Cannot write to %1: %2").arg(destinationPath, file.errorString())};
    }

    const auto data = text.toUtf8();
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw qvs::ScribeError{qvs::ErrorKind::WriteError,
                               QStringLiteral("Failed to write %1: %2").arg(destinationPath, file.errorString())};
    }

    if (!file.commit()) {
        throw qvs::ScribeError{qvs::ErrorKind::WriteError,
                               QStringLiteral("Failed to save %1: %2").arg(destinationPath, file.errorString())};
    }

    LOG_INFO_N << "Saved " << data.size() << " bytes of transcript to " << destinationPath;
}

int OutputManager::cleanup(const QStringList &artifactPaths, bool keepFiles)
{
    if (keepFiles) {
        LOG_DEBUG_N << "Keeping " << artifactPaths.size() << " output files";
        return 0;
    }

    int deleted = 0;
    for (const auto& path : artifactPaths) {
        if (!QFileInfo::exists(path)) {
            continue;
        }

        if (QFile::remove(path)) {
            LOG_TRACE_N << "Deleted " << path;
            ++deleted;
        } else {
            LOG_WARN_N << "Failed to delete " << path;
        }
    }

    return deleted;
}

bool OutputManager::clear(Session &session)
{
    return session.clear();
}

bool OutputManager::discardSource(const AudioSource &source, bool keepFiles)
{
    if (!source.isRecording() || keepFiles) {
        return false;
    }

    if (QFile::exists(source.path())) {
        if (QFile::remove(source.path())) {
            LOG_DEBUG_N << "Deleted recording " << source.path();
            return true;
        }
        LOG_WARN_N << "Failed to delete recording " << source.path();
    }

    return false;
}

QString OutputManager::suggestedFileName(const std::optional<AudioSource> &source, const QDateTime &now)
{
    if (source) {
        return source->baseName() + "_transcribed.txt";
    }

    return "transcription_" + now.toString("yyyyMMdd_HHmmss") + ".txt";
}
