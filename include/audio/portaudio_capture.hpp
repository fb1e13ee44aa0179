#ifndef PORTAUDIO_CAPTURE_HPP
#define PORTAUDIO_CAPTURE_HPP

#include "audio/audio_capture.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

typedef void PaStream;

struct InputDeviceInfo {
    int index = -1;
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefault = false;
};

class PortAudioCapture : public AudioCapture {
public:
    PortAudioCapture();
    ~PortAudioCapture() override;

    PortAudioCapture(const PortAudioCapture&) = delete;
    PortAudioCapture& operator=(const PortAudioCapture&) = delete;

    void open(const CaptureParams& params, BlockCallback onBlock, FinishedCallback onFinished) override;
    void start() override;
    void stop() override;
    bool isActive() const override;
    size_t takeStatusEvents() override { return statusEvents_.exchange(0); }

    static std::vector<InputDeviceInfo> listDevices();

    // PortAudio thread entry points.
    void handleBlock(const void* input, unsigned long frameCount, unsigned long statusFlags);
    void handleFinished();

private:
    CaptureParams params_;
    BlockCallback onBlock_;
    FinishedCallback onFinished_;

    mutable std::mutex mutex_;
    PaStream* stream_ = nullptr;
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> statusEvents_{0};
};

#endif
