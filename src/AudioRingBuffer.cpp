#include "AudioRingBuffer.h"

void AudioRingBuffer::push(Chunk &&chunk)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_chunks_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(chunk));
    }
    cv_.notify_one();
}

bool AudioRingBuffer::pop(Chunk &out)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]{ return !queue_.empty() || stopped_; });
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void AudioRingBuffer::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

size_t AudioRingBuffer::dropped() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
