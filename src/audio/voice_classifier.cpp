#include "audio/voice_classifier.hpp"
#include "core/errors.hpp"

#include <fvad.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

// Constructor
FvadDetector::FvadDetector(int sampleRate, int aggressiveness) {
    vad_ = fvad_new();
    if (!vad_) throw std::runtime_error("fvad_new failed");

    if (fvad_set_sample_rate(vad_, sampleRate) < 0) {
        fvad_free(vad_);
        vad_ = nullptr;
        throw ConfigError("VAD does not support sample rate " + std::to_string(sampleRate));
    }

    if (fvad_set_mode(vad_, aggressiveness) < 0) {
        fvad_free(vad_);
        vad_ = nullptr;
        throw ConfigError("VAD aggressiveness must be 0-3, got " + std::to_string(aggressiveness));
    }
}

// Destructor
FvadDetector::~FvadDetector() {
    if (vad_) fvad_free(vad_);
}

bool FvadDetector::isSpeech(const int16_t* samples, size_t count) {
    const int rc = fvad_process(vad_, samples, count);
    if (rc < 0) throw std::runtime_error("fvad_process rejected a frame of " + std::to_string(count) + " samples");
    return rc == 1;
}

// Constructor
VoiceClassifier::VoiceClassifier(Config config, std::unique_ptr<SpeechDetector> detector)
    : config_(config), detector_(std::move(detector)) {
    if (!isSupported(config_.sampleRate, config_.frameMs)) {
        throw ConfigError("Unsupported VAD frame: " + std::to_string(config_.frameMs) + " ms at " +
                          std::to_string(config_.sampleRate) + " Hz");
    }
    if (!detector_) throw ConfigError("VoiceClassifier needs a speech detector");

    frameSamples_ = FrameFormat{config_.sampleRate, config_.frameMs}.samplesPerFrame();
}

bool VoiceClassifier::isSupported(int sampleRate, int frameMs) {
    const bool rateOk = sampleRate == 8000 || sampleRate == 16000 || sampleRate == 32000 || sampleRate == 48000;
    const bool frameOk = frameMs == 10 || frameMs == 20 || frameMs == 30;
    return rateOk && frameOk;
}

float VoiceClassifier::meanAbsAmplitude(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double acc = 0.0;
    for (size_t i = 0; i < count; ++i) acc += std::abs((int)samples[i]);
    return (float)(acc / (double)count / 32768.0);
}

VoiceClassifier::Verdict VoiceClassifier::classify(const Frame& frame) {
    if (frame.samples.size() != frameSamples_) {
        throw std::invalid_argument("frame has " + std::to_string(frame.samples.size()) + " samples, expected " +
                                    std::to_string(frameSamples_));
    }

    Verdict v;
    v.speech = detector_->isSpeech(frame.samples.data(), frame.samples.size());
    v.energy = meanAbsAmplitude(frame.samples.data(), frame.samples.size());
    v.energyAbove = v.energy > config_.energyThreshold;
    return v;
}
