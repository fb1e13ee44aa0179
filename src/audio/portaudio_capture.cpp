#include "audio/portaudio_capture.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <portaudio.h>

#include <string>
#include <utility>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw AudioDeviceError(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

static PaSampleFormat toPaFormat(SampleFormat format) {
    switch (format) {
        case SampleFormat::Int16: return paInt16;
        case SampleFormat::Int32: return paInt32;
        case SampleFormat::Float32: return paFloat32;
    }
    return paInt16;
}

static int paStreamCallback(const void* input, void* /*output*/, unsigned long frameCount,
                            const PaStreamCallbackTimeInfo* /*timeInfo*/, PaStreamCallbackFlags statusFlags,
                            void* userData) {
    static_cast<PortAudioCapture*>(userData)->handleBlock(input, frameCount, statusFlags);
    return paContinue;
}

static void paStreamFinished(void* userData) {
    static_cast<PortAudioCapture*>(userData)->handleFinished();
}

// Constructor
PortAudioCapture::PortAudioCapture() {
    pa_check(Pa_Initialize(), "Pa_Initialize");
}

// Destructor
PortAudioCapture::~PortAudioCapture() {
    stop();
    Pa_Terminate();
}

std::vector<InputDeviceInfo> PortAudioCapture::listDevices() {
    pa_check(Pa_Initialize(), "Pa_Initialize");

    std::vector<InputDeviceInfo> devices;
    const PaDeviceIndex defaultIn = Pa_GetDefaultInputDevice();
    const int count = Pa_GetDeviceCount();
    if (count < 0) {
        Pa_Terminate();
        pa_check(count, "Pa_GetDeviceCount");
    }

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        InputDeviceInfo d;
        d.index = i;
        d.name = info->name ? info->name : "(unknown)";
        const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
        d.hostApi = api && api->name ? api->name : "";
        d.maxInputChannels = info->maxInputChannels;
        d.defaultSampleRate = info->defaultSampleRate;
        d.isDefault = (i == defaultIn);
        devices.push_back(d);
    }

    Pa_Terminate();
    return devices;
}

void PortAudioCapture::open(const CaptureParams& params, BlockCallback onBlock, FinishedCallback onFinished) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) throw AudioDeviceError("capture stream already open");

    params_ = params;
    onBlock_ = std::move(onBlock);
    onFinished_ = std::move(onFinished);
    stopping_ = false;
    statusEvents_ = 0;

    PaStreamParameters inParams{};
    inParams.device = params_.deviceIndex >= 0 ? params_.deviceIndex : Pa_GetDefaultInputDevice();
    if (inParams.device == paNoDevice) {
        throw AudioDeviceError("No default input device");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    if (!info) throw AudioDeviceError("Invalid input device index " + std::to_string(params_.deviceIndex));
    logInfo("Capture", std::string("Input device: ") + (info->name ? info->name : "(unknown)"));

    inParams.channelCount = params_.channels;
    inParams.sampleFormat = toPaFormat(params_.format);
    inParams.suggestedLatency = info->defaultLowInputLatency;
    inParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    pa_check(
        Pa_OpenStream(&stream, &inParams, nullptr,
                      params_.sampleRate, (unsigned long)params_.framesPerBlock,
                      paNoFlag, paStreamCallback, this),
        "Pa_OpenStream"
    );

    const PaError e = Pa_SetStreamFinishedCallback(stream, paStreamFinished);
    if (e != paNoError) {
        Pa_CloseStream(stream);
        pa_check(e, "Pa_SetStreamFinishedCallback");
    }
    stream_ = stream;
}

void PortAudioCapture::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_) throw AudioDeviceError("capture stream is not open");
    pa_check(Pa_StartStream(stream_), "Pa_StartStream");
}

void PortAudioCapture::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_) return;

    stopping_ = true;
    PaError e = Pa_StopStream(stream_);
    if (e != paNoError && e != paStreamIsStopped) {
        logWarn("Capture", std::string("Pa_StopStream: ") + Pa_GetErrorText(e));
    }
    e = Pa_CloseStream(stream_);
    if (e != paNoError) {
        logWarn("Capture", std::string("Pa_CloseStream: ") + Pa_GetErrorText(e));
    }
    stream_ = nullptr;
}

bool PortAudioCapture::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ && Pa_IsStreamActive(stream_) == 1;
}

void PortAudioCapture::handleBlock(const void* input, unsigned long frameCount, unsigned long statusFlags) {
    if (statusFlags != 0) statusEvents_.fetch_add(1);
    if (!input || !onBlock_) return;
    onBlock_(input, (size_t)frameCount, params_.format, params_.channels);
}

void PortAudioCapture::handleFinished() {
    if (stopping_.load()) return;
    if (onFinished_) onFinished_();
}
