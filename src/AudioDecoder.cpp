#include <array>

#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QSettings>

#include "AudioDecoder.h"
#include "AudioSource.h"
#include "ScopedTimer.h"
#include "ScribeError.h"
#include "WavFile.h"

#include "logging.h"

using namespace std;
using qvs::ErrorKind;
using qvs::ScribeError;

namespace {

bool looksLikeUnsupportedInput(const QString& ffmpegErrors)
{
    static const auto markers = to_array<QLatin1StringView>({
        QLatin1StringView{"Invalid data found when processing input"},
        QLatin1StringView{"does not contain any stream"},
        QLatin1StringView{"Output file does not contain any stream"},
        QLatin1StringView{"could not find codec parameters"},
        QLatin1StringView{"Unknown input format"},
    });

    for(const auto& m : markers) {
        if (ffmpegErrors.contains(m, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

} // anon ns

AudioDecoder::AudioDecoder(QString ffmpegPath)
    : ffmpeg_path_{ffmpegPath.isEmpty() ? QStringLiteral("ffmpeg") : std::move(ffmpegPath)}
{
}

std::vector<float> AudioDecoder::decode(const AudioSource &source, const abort_fn_t& abort) const
{
    const ScopedTimer timer;
    const auto& path = source.path();

    if (!QFileInfo::exists(path)) {
        throw ScribeError{ErrorKind::FileNotFound, QStringLiteral("Audio file not found: %1").arg(path)};
    }

    bool handled = false;
    auto samples = readNativeWav(path, handled);
    if (!handled) {
        samples = runFfmpeg(path, abort);
    }

    if (samples.empty()) {
        throw ScribeError{ErrorKind::TranscriptionFailure,
                          QStringLiteral("The audio file %1 contains no audio.").arg(QFileInfo{path}.fileName())};
    }

    if (samples.size() < min_samples) {
        throw ScribeError{ErrorKind::TranscriptionFailure,
                          QStringLiteral("The audio in %1 is too short to transcribe.").arg(QFileInfo{path}.fileName())};
    }

    LOG_DEBUG_N << "Decoded " << samples.size() << " samples ("
                << static_cast<double>(samples.size()) / sample_rate << " seconds) from "
                << path << " in " << timer.elapsed() << " seconds";
    return samples;
}

QStringList AudioDecoder::ffmpegArguments(const QString &inputPath)
{
    return {
        "-nostdin",
        "-hide_banner",
        "-loglevel", "error",
        "-i", inputPath,
        "-vn",
        "-ac", "1",
        "-ar", QString::number(sample_rate),
        "-f", "s16le",
        "-acodec", "pcm_s16le",
        "pipe:1"
    };
}

QString AudioDecoder::ffmpegFromSettings()
{
    return QSettings{}.value("ffmpeg/path", "ffmpeg").toString().trimmed();
}

std::vector<float> AudioDecoder::toFloat(std::span<const int16_t> samples)
{
    std::vector<float> out;
    out.reserve(samples.size());
    for(const auto s : samples) {
        out.push_back(static_cast<float>(s) / 32768.0f);
    }
    return out;
}

std::vector<float> AudioDecoder::readNativeWav(const QString &path, bool& handled) const
{
    handled = false;

    if (QFileInfo{path}.suffix().compare("wav", Qt::CaseInsensitive) != 0) {
        return {};
    }

    QFile file{path};
    if (!file.open(QIODevice::ReadOnly)) {
        throw ScribeError{ErrorKind::TranscriptionFailure,
                          QStringLiteral("Failed to open %1: %2").arg(path, file.errorString())};
    }

    const auto info = wav::probe(file);
    if (!info || !info->format.isWhisperNative()) {
        LOG_DEBUG_N << path << " needs conversion. Using ffmpeg.";
        return {};
    }

    handled = true;
    if (!file.seek(info->data_offset)) {
        throw ScribeError{ErrorKind::TranscriptionFailure,
                          QStringLiteral("Failed to read %1: %2").arg(path, file.errorString())};
    }

    const auto pcm = file.read(info->data_size);
    const span<const int16_t> samples{reinterpret_cast<const int16_t *>(pcm.constData()),
                                      static_cast<size_t>(pcm.size()) / sizeof(int16_t)};
    return toFloat(samples);
}

std::vector<float> AudioDecoder::runFfmpeg(const QString &path, const abort_fn_t& abort) const
{
    QProcess proc;
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.setStandardInputFile(QProcess::nullDevice());

    LOG_DEBUG_N << "Decoding " << path << " with " << ffmpeg_path_;
    proc.start(ffmpeg_path_, ffmpegArguments(path));

    if (!proc.waitForStarted()) {
        LOG_ERROR_N << "Failed to start " << ffmpeg_path_ << ": " << proc.errorString();
        throw ScribeError{ErrorKind::TranscriptionFailure,
                          QStringLiteral("Could not run ffmpeg (%1). Please make sure ffmpeg is installed, "
                                         "or set \"ffmpeg/path\" in the settings.").arg(ffmpeg_path_)};
    }

    QByteArray pcm;
    QByteArray errors;

    // Keep the pipes drained, or ffmpeg blocks on a full stdout
    while (proc.state() != QProcess::NotRunning) {
        proc.waitForReadyRead(100);
        pcm += proc.readAllStandardOutput();
        errors += proc.readAllStandardError();

        if (abort && abort()) {
            LOG_DEBUG_N << "Aborting ffmpeg";
            proc.kill();
            proc.waitForFinished();
            throw ScribeError{ErrorKind::TranscriptionFailure, QStringLiteral("Decoding was aborted.")};
        }
    }

    proc.waitForFinished();
    pcm += proc.readAllStandardOutput();
    errors += proc.readAllStandardError();

    const auto error_text = QString::fromUtf8(errors).trimmed();

    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        LOG_WARN_N << "ffmpeg failed on " << path << " with exit code " << proc.exitCode()
                   << ": " << error_text;

        if (looksLikeUnsupportedInput(error_text)) {
            throw ScribeError{ErrorKind::UnsupportedFormat,
                              QStringLiteral("The file %1 could not be decoded as audio.")
                                  .arg(QFileInfo{path}.fileName())};
        }

        throw ScribeError{ErrorKind::TranscriptionFailure,
                          QStringLiteral("ffmpeg failed to decode %1: %2")
                              .arg(QFileInfo{path}.fileName(), error_text)};
    }

    if (!error_text.isEmpty()) {
        LOG_DEBUG_N << "ffmpeg: " << error_text;
    }

    const span<const int16_t> samples{reinterpret_cast<const int16_t *>(pcm.constData()),
                                      static_cast<size_t>(pcm.size()) / sizeof(int16_t)};
    return toFloat(samples);
}
