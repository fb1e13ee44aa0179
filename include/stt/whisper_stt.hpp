#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/transcriber.hpp"

#include <string>
#include <vector>

struct whisper_context;

// Local whisper.cpp model. Only the sink thread calls transcribe().
class WhisperSTT : public Transcriber {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base.en.bin";
        std::string language = "en";
        int threads = 4;
        float noSpeechThreshold = 0.6f;
    };

    explicit WhisperSTT(Config config);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const std::vector<uint8_t>& wav) override;

private:
    std::string transcribePcm(const std::vector<float>& pcm16kMono);

    Config config_;
    whisper_context* context_ = nullptr;
};

#endif
