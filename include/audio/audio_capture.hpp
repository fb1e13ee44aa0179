#ifndef AUDIO_CAPTURE_HPP
#define AUDIO_CAPTURE_HPP

#include "audio/frame.hpp"

#include <cstddef>
#include <functional>

struct CaptureParams {
    int sampleRate = 16000;
    int channels = 1;
    size_t framesPerBlock = 480;
    SampleFormat format = SampleFormat::Int16;

    // -1 selects the default input device.
    int deviceIndex = -1;
};

// Input device delivering interleaved blocks on its own thread.
class AudioCapture {
public:
    // Called on the device thread. Must not block.
    using BlockCallback = std::function<void(const void* data, size_t frameCount, SampleFormat format, int channels)>;

    // Called when the stream ends without stop() having been requested.
    using FinishedCallback = std::function<void()>;

    virtual ~AudioCapture() = default;

    // Throws AudioDeviceError.
    virtual void open(const CaptureParams& params, BlockCallback onBlock, FinishedCallback onFinished) = 0;
    virtual void start() = 0;

    // Stops and closes the device. Safe to call more than once.
    virtual void stop() = 0;

    virtual bool isActive() const = 0;

    // Under/overflow flags reported by the device since the previous call.
    virtual size_t takeStatusEvents() = 0;
};

#endif
