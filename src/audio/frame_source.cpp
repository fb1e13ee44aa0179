#include "audio/frame_source.hpp"
#include "core/log.hpp"

#include <chrono>
#include <utility>

// Constructor
FrameSource::FrameSource(Config config, AudioCapture& capture, std::shared_ptr<FrameChannel> channel)
    : config_(config), capture_(capture), channel_(std::move(channel)) {}

// Destructor
FrameSource::~FrameSource() { stop(); }

void FrameSource::start() {
    if (running_.exchange(true)) return;
    deviceLost_ = false;

    CaptureParams params;
    params.sampleRate = config_.format.sampleRate;
    params.channels = config_.channels;
    params.framesPerBlock = config_.format.samplesPerFrame();
    params.format = config_.captureFormat;
    params.deviceIndex = config_.deviceIndex;

    try {
        capture_.open(params,
                      [this](const void* data, size_t n, SampleFormat fmt, int ch) { onBlock(data, n, fmt, ch); },
                      [this] { onFinished(); });
        capture_.start();
    } catch (...) {
        running_ = false;
        capture_.stop();
        throw;
    }

    logInfo("Frame Source", strCat("Capturing ", config_.format.sampleRate, " Hz, ", config_.format.frameMs,
                                   " ms frames (", config_.format.samplesPerFrame(), " samples, ",
                                   sampleFormatName(config_.captureFormat), ", ", config_.channels, " ch)"));
}

void FrameSource::stop() {
    if (!running_.exchange(false)) return;

    // Close the device before the sentinel so no frame can follow it.
    capture_.stop();
    channel_->pushEndOfStream();

    logInfo("Frame Source", strCat("Capture stopped after ", framesCaptured_.load(), " frames"));
}

void FrameSource::onBlock(const void* data, size_t frameCount, SampleFormat format, int channels) {
    Frame frame;
    frame.captured = std::chrono::steady_clock::now();
    frame.samples = toMonoPcm16(data, frameCount, format, channels);
    if (normalizeFrameLength(frame.samples, config_.format.samplesPerFrame())) framesNormalized_.fetch_add(1);

    framesCaptured_.fetch_add(1);
    channel_->push(std::move(frame));
}

void FrameSource::onFinished() {
    if (!running_.load()) return;

    deviceLost_ = true;
    channel_->pushEndOfStream();
    if (onDeviceLost_) onDeviceLost_();
}
