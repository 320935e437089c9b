#include <limits>

#include "AudioFileWriter.h"
#include "ScribeError.h"

#include "logging.h"

using namespace std;

AudioFileWriter::AudioFileWriter(AudioRingBuffer *ring, const wav::Format& format, const QString &filePath)
    : ring_(ring),
    format_{format},
    path_{filePath},
    file_(filePath)
{
    LOG_DEBUG_N << "Creating AudioFileWriter for file " << filePath;
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_WARN_N << "Failed to open file " << filePath << ": " << file_.errorString();
        throw qvs::ScribeError{qvs::ErrorKind::WriteError,
                               QStringLiteral("Failed to create the recording file %1: %2")
                                   .arg(filePath, file_.errorString())};
    }

    // Placeholder. The sizes are filled in when we stop.
    if (file_.write(wav::makeHeader(format_, 0)) != wav::header_size) {
        const auto why = file_.errorString();
        file_.close();
        QFile::remove(filePath);
        throw qvs::ScribeError{qvs::ErrorKind::WriteError,
                               QStringLiteral("Failed to write to the recording file %1: %2")
                                   .arg(filePath, why)};
    }

    thread_ = std::jthread([this] { run(); });
}

AudioFileWriter::~AudioFileWriter()
{
    stop();
}

qint64 AudioFileWriter::stop()
{
    if (stopped_.exchange(true)) {
        return data_bytes_;
    }

    LOG_DEBUG_N << "Stopping AudioFileWriter";
    if (ring_) {
        ring_->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    finalizeHeader();
    file_.close();

    if (ring_ && ring_->dropped() > 0) {
        LOG_WARN_N << "The writer fell behind. " << ring_->dropped() << " audio chunks were dropped.";
    }

    return data_bytes_;
}

void AudioFileWriter::run()
{
    AudioRingBuffer::Chunk chunk;
    auto segment = 0u;

    // pop() keeps returning data after stop() until the buffer is empty
    while (ring_->pop(chunk)) {
        if (write_failed_) {
            continue;
        }

        LOG_TRACE_N << "Writing #" << ++segment << " offset=" << data_bytes_ << " size=" << chunk.size();

        const qint64 written = file_.write(chunk);
        if (written != chunk.size()) {
            LOG_ERROR_N << "AudioFileWriter: failed to write to " << path_ << ": " << file_.errorString();
            write_failed_ = true;
            continue;
        }

        data_bytes_ += written;
    }

    LOG_DEBUG_N << "AudioFileWriter: ring buffer stopped and drained";
}

void AudioFileWriter::finalizeHeader()
{
    if (!file_.isOpen()) {
        return;
    }

    const auto bytes = min<qint64>(data_bytes_, numeric_limits<uint32_t>::max() - wav::header_size);
    if (!file_.seek(0)
        || file_.write(wav::makeHeader(format_, static_cast<uint32_t>(bytes))) != wav::header_size
        || !file_.flush()) {
        LOG_ERROR_N << "Failed to update the wav header in " << path_ << ": " << file_.errorString();
        write_failed_ = true;
        return;
    }

    LOG_DEBUG_N << "Finalized " << path_ << " with " << bytes << " bytes of audio";
}
