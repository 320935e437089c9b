#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include <QByteArray>

/*! Bounded queue of raw audio chunks between the Qt audio thread and the file writer.
 *
 *  If the writer falls behind, the oldest chunk is dropped.
 */
class AudioRingBuffer
{
public:
    using Chunk = QByteArray;

    explicit AudioRingBuffer(size_t maxChunks = 256)
        : max_chunks_{maxChunks} {}

    void push(Chunk &&chunk);

    // Blocks until there is data, or the buffer is stopped and drained.
    bool pop(Chunk &out);

    // Wakes up the consumer. Remaining chunks can still be popped.
    void stop();

    size_t dropped() const;

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<Chunk>       queue_;
    const size_t            max_chunks_;
    size_t                  dropped_{};
    bool                    stopped_{false};
};
