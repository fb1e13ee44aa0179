#ifndef FRAME_CHANNEL_HPP
#define FRAME_CHANNEL_HPP

#include "audio/frame.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Bounded FIFO between the capture callback and the segmentation worker.
//
// push() never blocks the capture thread: when the channel is full the oldest
// queued frame is discarded and counted. The consumer reports the count.
// The end-of-stream sentinel is queued behind all pending frames and is never
// discarded; once it is queued further pushes are refused.
class FrameChannel {
public:
    enum class PopResult { Frame, EndOfStream, Timeout };

    explicit FrameChannel(size_t capacity);

    FrameChannel(const FrameChannel&) = delete;
    FrameChannel& operator=(const FrameChannel&) = delete;

    bool push(Frame&& frame);
    void pushEndOfStream();

    PopResult pop(Frame& out, std::chrono::milliseconds timeout);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool endOfStreamQueued() const;

    size_t droppedTotal() const { return dropped_.load(); }
    // Frames dropped since the previous call.
    size_t takeDropped() { return droppedSinceReport_.exchange(0); }

private:
    struct Item {
        Frame frame;
        bool endOfStream = false;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Item> queue_;
    const size_t capacity_;
    bool endQueued_ = false;

    std::atomic<size_t> dropped_{0};
    std::atomic<size_t> droppedSinceReport_{0};
};

#endif
