#pragma once

#include <cstdint>
#include <vector>

#include <QString>
#include <QStringList>

struct TranscriptSegment {
    int64_t start_ms{};
    int64_t end_ms{};
    QString text;
};

using segments_t = std::vector<TranscriptSegment>;

/*! Renders whisper segments in the usual sidecar formats.
 *
 *  Same layout as whisper-cli's -otxt -osrt -ovtt -otsv -oj outputs.
 */
namespace transcript {

// HH:MM:SS,mmm
QString srtTimestamp(int64_t ms);

// HH:MM:SS.mmm, or MM:SS.mmm when below one hour
QString vttTimestamp(int64_t ms);

QString toText(const segments_t& segments);
QString toSrt(const segments_t& segments);
QString toVtt(const segments_t& segments);
QString toTsv(const segments_t& segments);
QString toJson(const segments_t& segments, const QString& language);

/*! Writes <baseName>.{txt,srt,vtt,tsv,json} to `directory`.
 *
 *  \return The paths of the written files, in that order.
 *  \throws ScribeError WriteError if a file can't be written. Files
 *          already written by this call are removed again.
 */
QStringList writeAll(const QString& directory,
                     const QString& baseName,
                     const segments_t& segments,
                     const QString& language);

} // ns
