#ifndef VOICE_CLASSIFIER_HPP
#define VOICE_CLASSIFIER_HPP

#include "audio/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

struct Fvad;

// Per-frame speech / non-speech decision.
class SpeechDetector {
public:
    virtual ~SpeechDetector() = default;

    // `count` is always a supported frame length for the configured rate.
    virtual bool isSpeech(const int16_t* samples, size_t count) = 0;
};

// WebRTC VAD through libfvad. Mode 0 is the most permissive, 3 the most aggressive.
class FvadDetector : public SpeechDetector {
public:
    FvadDetector(int sampleRate, int aggressiveness);
    ~FvadDetector() override;

    FvadDetector(const FvadDetector&) = delete;
    FvadDetector& operator=(const FvadDetector&) = delete;

    bool isSpeech(const int16_t* samples, size_t count) override;

private:
    Fvad* vad_ = nullptr;
};

class VoiceClassifier {
public:
    struct Config {
        int sampleRate = 16000;
        int frameMs = 30;

        // Mean absolute amplitude on a [-1, 1] scale.
        float energyThreshold = 0.01f;
    };

    struct Verdict {
        bool speech = false;
        float energy = 0.0f;
        bool energyAbove = false;
    };

    // Throws ConfigError when the rate / duration pair is not one the detector accepts.
    VoiceClassifier(Config config, std::unique_ptr<SpeechDetector> detector);

    // Throws std::invalid_argument for a frame of the wrong length.
    Verdict classify(const Frame& frame);

    size_t frameSamples() const { return frameSamples_; }

    static bool isSupported(int sampleRate, int frameMs);
    static float meanAbsAmplitude(const int16_t* samples, size_t count);

private:
    Config config_;
    size_t frameSamples_ = 0;
    std::unique_ptr<SpeechDetector> detector_;
};

#endif
