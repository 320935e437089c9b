#include <algorithm>
#include <cmath>

#include "AudioCaptureDevice.h"

#include "logging.h"

using namespace std;

AudioCaptureDevice::AudioCaptureDevice(AudioRingBuffer *ring, const QAudioFormat &format,
                                       qsizetype chunkSize, QObject *parent)
    : QIODevice(parent)
    , ring_(ring)
    , format_{format}
    , chunk_size_{chunkSize}
{
    Q_ASSERT(ring_);
    prepareBuffer();
}

bool AudioCaptureDevice::open(OpenMode mode)
{
    LOG_DEBUG_N << "Opening AudioCaptureDevice in mode " << mode.toInt();
    if (!(mode & WriteOnly)) {
        LOG_ERROR_N << "AudioCaptureDevice can only be opened in WriteOnly mode";
        return false;
    }

    first_write_ = true;
    bytes_captured_ = 0;
    recording_level_ = 0;
    prepareBuffer();

    const auto res = QIODevice::open(mode);
    if (!res) {
        LOG_ERROR_N << "Failed to open AudioCaptureDevice";
    }
    return res;
}

void AudioCaptureDevice::close()
{
    LOG_DEBUG_N << "Closing AudioCaptureDevice after " << bytes_captured_ << " bytes";

    // Whatever is left in the buffer belongs to the recording
    flushBuffer();
    QIODevice::close();
}

qint64 AudioCaptureDevice::writeData(const char *data, qint64 len)
{
    if (first_write_) {
        chunk_start_time_ = chrono::steady_clock::now();
        first_write_ = false;
    }

    qint64 written = 0;

    do {
        const auto bytes_left = chunk_size_ - audio_buffer_.size();
        const auto bytes_to_add = min<qint64>(bytes_left, len - written);

        audio_buffer_.append(data + written, bytes_to_add);
        written += bytes_to_add;

        const auto chunk_duration = chrono::steady_clock::now() - chunk_start_time_;
        if (chunk_duration >= 200ms || audio_buffer_.size() >= chunk_size_) {
            flushBuffer();
        }

    } while (written < len);

    bytes_captured_ += len;
    return len;
}

void AudioCaptureDevice::prepareBuffer()
{
    audio_buffer_.clear();
    audio_buffer_.reserve(chunk_size_);
}

void AudioCaptureDevice::flushBuffer()
{
    if (audio_buffer_.isEmpty()) {
        return;
    }

    recalculateRecordingLevel(audio_buffer_);
    ring_->push(std::move(audio_buffer_));
    chunk_start_time_ = chrono::steady_clock::now();
    prepareBuffer();
}

void AudioCaptureDevice::recalculateRecordingLevel(const QByteArray& chunk)
{
    double peak = 0.0;

    switch(format_.sampleFormat()) {
    case QAudioFormat::Int16: {
        const span<const qint16> samples{reinterpret_cast<const qint16*>(chunk.constData()),
                                         static_cast<size_t>(chunk.size()) / sizeof(qint16)};
        for (const auto s : samples) {
            peak = max(peak, abs(static_cast<double>(s) / 32768.0));
        }
    } break;
    case QAudioFormat::Float: {
        const span<const float> samples{reinterpret_cast<const float*>(chunk.constData()),
                                        static_cast<size_t>(chunk.size()) / sizeof(float)};
        for (const auto s : samples) {
            peak = max(peak, abs(static_cast<double>(s)));
        }
    } break;
    default:
        // No meter for the exotic formats
        return;
    }

    // Low-pass filter so the meter doesn't flicker
    constexpr double alpha = 0.3;
    const double new_level = clamp(alpha * peak + (1.0 - alpha) * recording_level_, 0.0, 1.0);

    if (abs(new_level - recording_level_) < 0.001) {
        return;
    }

    recording_level_ = new_level;
    emit recordingLevelUpdated(recording_level_);
}
