#ifndef FRAME_SOURCE_HPP
#define FRAME_SOURCE_HPP

#include "audio/audio_capture.hpp"
#include "audio/frame.hpp"
#include "audio/frame_channel.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>

// Turns device blocks into canonical frames on the channel.
//
// The capture callback only converts, timestamps and enqueues. stop() closes
// the device first and then queues the end-of-stream sentinel; an unexpected
// end of the device stream queues the sentinel as well and reports it.
class FrameSource {
public:
    struct Config {
        FrameFormat format;
        int channels = 1;
        SampleFormat captureFormat = SampleFormat::Int16;
        int deviceIndex = -1;
    };

    using DeviceLostCallback = std::function<void()>;

    FrameSource(Config config, AudioCapture& capture, std::shared_ptr<FrameChannel> channel);
    ~FrameSource();

    FrameSource(const FrameSource&) = delete;
    FrameSource& operator=(const FrameSource&) = delete;

    void setDeviceLostCallback(DeviceLostCallback callback) { onDeviceLost_ = std::move(callback); }

    // Throws AudioDeviceError.
    void start();
    void stop();

    bool running() const { return running_.load(); }
    bool deviceLost() const { return deviceLost_.load(); }

    size_t framesCaptured() const { return framesCaptured_.load(); }
    size_t framesNormalized() const { return framesNormalized_.load(); }
    size_t takeStatusEvents() { return capture_.takeStatusEvents(); }

private:
    void onBlock(const void* data, size_t frameCount, SampleFormat format, int channels);
    void onFinished();

    Config config_;
    AudioCapture& capture_;
    std::shared_ptr<FrameChannel> channel_;
    DeviceLostCallback onDeviceLost_;

    std::atomic<bool> running_{false};
    std::atomic<bool> deviceLost_{false};
    std::atomic<size_t> framesCaptured_{0};
    std::atomic<size_t> framesNormalized_{0};
};

#endif
