#include "audio/frame_channel.hpp"

#include <utility>

FrameChannel::FrameChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool FrameChannel::push(Frame&& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (endQueued_) return false;

        // Only frames are queued until the sentinel, so the front is always a frame here.
        while (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_.fetch_add(1);
            droppedSinceReport_.fetch_add(1);
        }

        Item item;
        item.frame = std::move(frame);
        queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
}

void FrameChannel::pushEndOfStream() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (endQueued_) return;
        endQueued_ = true;

        Item item;
        item.endOfStream = true;
        queue_.push_back(std::move(item));
    }
    cv_.notify_all();
}

FrameChannel::PopResult FrameChannel::pop(Frame& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || endQueued_; })) {
        return PopResult::Timeout;
    }
    // Sentinel already consumed: the stream stays ended.
    if (queue_.empty()) return PopResult::EndOfStream;

    Item item = std::move(queue_.front());
    queue_.pop_front();

    if (item.endOfStream) return PopResult::EndOfStream;
    out = std::move(item.frame);
    return PopResult::Frame;
}

size_t FrameChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool FrameChannel::endOfStreamQueued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endQueued_;
}
