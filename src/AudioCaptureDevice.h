#pragma once

#include <chrono>
#include <span>

#include <QAudioFormat>
#include <QIODevice>

#include "AudioRingBuffer.h"

/*! Write-only QIODevice that QAudioSource pushes microphone data into.
 *
 *  Data is collected into chunks of up to `chunkSize` bytes, or 200ms,
 *  and handed over to the ring buffer. It also computes a smoothed
 *  peak level for the UI.
 */
class AudioCaptureDevice : public QIODevice
{
    Q_OBJECT
public:
    AudioCaptureDevice(AudioRingBuffer *ring, const QAudioFormat& format,
                       qsizetype chunkSize, QObject *parent = nullptr);

    bool open(OpenMode mode) override;

    void close() override;

    qint64 bytesCaptured() const noexcept { return bytes_captured_; }

protected:
    qint64 readData(char *, qint64) override
    {
        return -1;
    }

    qint64 writeData(const char *data, qint64 len) override;

signals:
    void recordingLevelUpdated(qreal level);

private:
    void prepareBuffer();
    void flushBuffer();
    void recalculateRecordingLevel(const QByteArray& chunk);

    AudioRingBuffer *ring_;
    const QAudioFormat format_;
    const qsizetype chunk_size_;
    QByteArray audio_buffer_;
    std::chrono::steady_clock::time_point chunk_start_time_;
    bool first_write_{true};
    qint64 bytes_captured_{};
    qreal recording_level_{};
};
