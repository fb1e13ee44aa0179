#include "stt/whisper_stt.hpp"
#include "audio/wav.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <whisper.h>

#include <utility>

// Constructor
WhisperSTT::WhisperSTT(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) throw ConfigError("whisper_init_from_file_with_params failed: " + config_.modelPath);

    logInfo("Whisper STT", "Loaded model " + config_.modelPath);
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Decodes the WAV and converts it to float samples for whisper
std::string WhisperSTT::transcribe(const std::vector<uint8_t>& wav) {
    WavData data;
    try {
        data = decodeWav(wav);
    } catch (const WavFormatError& e) {
        throw TranscriptionError(std::string("bad audio: ") + e.what());
    }

    if (data.channels != 1 || data.sampleRate != WHISPER_SAMPLE_RATE) {
        throw TranscriptionError("whisper needs mono " + std::to_string(WHISPER_SAMPLE_RATE) + " Hz audio, got " +
                                 std::to_string(data.channels) + " ch at " + std::to_string(data.sampleRate) + " Hz");
    }

    std::vector<float> pcm(data.samples.size());
    for (size_t i = 0; i < pcm.size(); ++i) pcm[i] = (float)data.samples[i] / 32768.0f;
    return transcribePcm(pcm);
}

// Converts pcm16kMono into text (std::string)
std::string WhisperSTT::transcribePcm(const std::vector<float>& pcm16kMono) {
    if (pcm16kMono.empty()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    params.n_threads = config_.threads;
    params.language = config_.language.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (rc != 0) throw TranscriptionError("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);
    return out;
}
