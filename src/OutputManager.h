#pragma once

#include <optional>

#include <QDateTime>
#include <QString>
#include <QStringList>

#include "AudioSource.h"

class Session;

/*! Persists and cleans up the results of a transcription.
 *
 *  The transcript itself lives in the Session. This class deals with
 *  the files.
 */
class OutputManager
{
public:
    /*! Write `text` as UTF-8 to `destinationPath`, replacing any existing file.
     *
     *  The file is written to a temporary file and renamed into place.
     *  \throws ScribeError WriteError on any I/O failure.
     */
    static void save(const QString& text, const QString& destinationPath);

    /*! Delete the sidecar files unless the user wants to keep them.
     *
     *  Files that don't exist are skipped, so it's safe to call more than once.
     *  \return Number of files actually deleted.
     */
    static int cleanup(const QStringList& artifactPaths, bool keepFiles);

    // Reset the in-memory transcript. Files are not touched.
    static bool clear(Session& session);

    /*! Delete a source we no longer need.
     *
     *  Only our own recordings are ever deleted, and only if `keepFiles` is false.
     *  \return true if the file was deleted.
     */
    static bool discardSource(const AudioSource& source, bool keepFiles);

    // "<source>_transcribed.txt", or "transcription_yyyyMMdd_HHmmss.txt" without a source
    static QString suggestedFileName(const std::optional<AudioSource>& source,
                                     const QDateTime& now = QDateTime::currentDateTime());
};
