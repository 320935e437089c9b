#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

#include <QString>
#include <QStringList>

class AudioSource;

/*! Turns an audio source into 16 kHz mono float samples for whisper.
 *
 *  16-bit PCM wav files that are already 16 kHz mono (our own recordings)
 *  are read directly. Anything else is decoded by an ffmpeg child process
 *  that writes raw s16le samples to its stdout.
 *
 *  decode() blocks. It is meant to be called from the transcription worker.
 */
class AudioDecoder
{
public:
    using abort_fn_t = std::function<bool()>;

    static constexpr int sample_rate = 16000;

    // Anything shorter than 100 ms is not worth sending to whisper
    static constexpr size_t min_samples = sample_rate / 10;

    explicit AudioDecoder(QString ffmpegPath = ffmpegFromSettings());

    /*! Decode the source.
     *
     *  \throws ScribeError UnsupportedFormat if ffmpeg can't make sense of the
     *          file, TranscriptionFailure if the audio is empty or too short,
     *          or decoding fails for some other reason.
     */
    std::vector<float> decode(const AudioSource& source, const abort_fn_t& abort = {}) const;

    const QString& ffmpegPath() const noexcept { return ffmpeg_path_; }

    static QStringList ffmpegArguments(const QString& inputPath);
    static QString ffmpegFromSettings();
    static std::vector<float> toFloat(std::span<const int16_t> samples);

private:
    std::vector<float> readNativeWav(const QString& path, bool& handled) const;
    std::vector<float> runFfmpeg(const QString& path, const abort_fn_t& abort) const;

    QString ffmpeg_path_;
};
