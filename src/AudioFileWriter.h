#pragma once

#include <atomic>
#include <thread>

#include <QFile>

#include "AudioRingBuffer.h"
#include "WavFile.h"

/*! Drains the ring buffer into a wav file on its own thread.
 *
 *  The header is written with zero sizes when the file is opened, and
 *  rewritten with the real sizes by stop().
 */
class AudioFileWriter
{
public:
    // Throws ScribeError (WriteError) if the file can't be created
    AudioFileWriter(AudioRingBuffer *ring,
                    const wav::Format& format,
                    const QString &filePath);

    ~AudioFileWriter();

    AudioFileWriter(const AudioFileWriter&) = delete;
    AudioFileWriter& operator=(const AudioFileWriter&) = delete;

    // Returns the number of sample bytes written
    qint64 stop();

    const QString& path() const noexcept { return path_; }

    // True if some of the audio could not be written to the file
    bool failed() const noexcept { return write_failed_; }

private:
    void run();
    void finalizeHeader();

    AudioRingBuffer *ring_{};
    const wav::Format format_;
    const QString    path_;
    QFile            file_;
    std::jthread     thread_;
    std::atomic_bool stopped_{false};
    std::atomic<qint64> data_bytes_{0};
    std::atomic_bool write_failed_{false};
};
