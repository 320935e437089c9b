#include <array>
#include <utility>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include "TranscriptFormats.h"
#include "ScribeError.h"
#include "logging.h"

using namespace std;

namespace transcript {

namespace {

struct Hms {
    int64_t h, m, s, ms;
};

Hms split(int64_t ms) {
    ms = max<int64_t>(ms, 0);
    return {ms / 3'600'000, (ms / 60'000) % 60, (ms / 1000) % 60, ms % 1000};
}

QString pad(int64_t value, int width) {
    return QStringLiteral("%1").arg(value, width, 10, QLatin1Char('0'));
}

void writeFile(const QString& path, const QString& content) {
    QSaveFile file{path};
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw qvs::ScribeError{qvs::ErrorKind::WriteError,
                               QStringLiteral("Cannot write %1: %2").arg(path, file.errorString())};
    }

    const auto data = content.toUtf8();
    if (file.write(data) != data.size() || !file.commit()) {
        throw qvs::ScribeError{qvs::ErrorKind::WriteError,
                               QStringLiteral("Failed to write %1: %2").arg(path, file.errorString())};
    }
}

} // anon ns

QString srtTimestamp(int64_t ms)
{
    const auto t = split(ms);
    return QStringLiteral("%1:%2:%3,%4").arg(pad(t.h, 2), pad(t.m, 2), pad(t.s, 2), pad(t.ms, 3));
}

QString vttTimestamp(int64_t ms)
{
    const auto t = split(ms);
    if (t.h == 0) {
        return QStringLiteral("%1:%2.%3").arg(pad(t.m, 2), pad(t.s, 2), pad(t.ms, 3));
    }
    return QStringLiteral("%1:%2:%3.%4").arg(pad(t.h, 2), pad(t.m, 2), pad(t.s, 2), pad(t.ms, 3));
}

QString toText(const segments_t &segments)
{
    QString out;
    for (const auto& s : segments) {
        out += s.text.trimmed();
        out += '\n';
    }
    return out;
}

QString toSrt(const segments_t &segments)
{
    QString out;
    int index = 0;
    for (const auto& s : segments) {
        out += QString::number(++index) + '\n';
        out += srtTimestamp(s.start_ms) + " --> " + srtTimestamp(s.end_ms) + '\n';
        out += s.text.trimmed() + "\n\n";
    }
    return out;
}

QString toVtt(const segments_t &segments)
{
    QString out{"WEBVTT\n\n"};
    for (const auto& s : segments) {
        out += vttTimestamp(s.start_ms) + " --> " + vttTimestamp(s.end_ms) + '\n';
        out += s.text.trimmed() + "\n\n";
    }
    return out;
}

QString toTsv(const segments_t &segments)
{
    QString out{"start\tend\ttext\n"};
    for (const auto& s : segments) {
        auto text = s.text.trimmed();
        text.replace('\t', ' ');
        out += QString::number(s.start_ms) + '\t' + QString::number(s.end_ms) + '\t' + text + '\n';
    }
    return out;
}

QString toJson(const segments_t &segments, const QString& language)
{
    QJsonArray jsegments;
    QString full;
    for (const auto& s : segments) {
        jsegments.append(QJsonObject{
            {"start", static_cast<qint64>(s.start_ms)},
            {"end", static_cast<qint64>(s.end_ms)},
            {"text", s.text.trimmed()},
        });
        full += s.text;
    }

    const QJsonObject root{
        {"language", language},
        {"text", full.trimmed()},
        {"segments", jsegments},
    };

    return QString::fromUtf8(QJsonDocument{root}.toJson(QJsonDocument::Indented));
}

QStringList writeAll(const QString &directory,
                     const QString &baseName,
                     const segments_t &segments,
                     const QString &language)
{
    const QDir dir{directory};
    const auto path = [&](const char *ext) {
        return dir.filePath(baseName + '.' + QLatin1String(ext));
    };

    const std::array<std::pair<QString, QString>, 5> outputs{{
        {path("txt"), toText(segments)},
        {path("srt"), toSrt(segments)},
        {path("vtt"), toVtt(segments)},
        {path("tsv"), toTsv(segments)},
        {path("json"), toJson(segments, language)},
    }};

    QStringList written;
    try {
        for (const auto& [file, content] : outputs) {
            writeFile(file, content);
            written << file;
        }
    } catch (const qvs::ScribeError& ex) {
        LOG_WARN_N << "Writing sidecar files failed: " << ex.what();
        for (const auto& file : written) {
            QFile::remove(file);
        }
        throw;
    }

    LOG_DEBUG_N << "Wrote " << written.size() << " sidecar files to " << directory;
    return written;
}

} // ns
