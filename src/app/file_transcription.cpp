#include "app/file_transcription.hpp"
#include "app/utterance_sink.hpp"
#include "audio/frame.hpp"
#include "audio/wav.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <cmath>
#include <fstream>

static const char* kComponent = "File";

std::vector<int16_t> resampleLinear(const std::vector<int16_t>& pcm, int fromRate, int toRate) {
    if (fromRate == toRate || pcm.empty()) return pcm;

    const size_t outCount = (size_t)((double)pcm.size() * toRate / fromRate);
    std::vector<int16_t> out(outCount);
    const double step = (double)fromRate / toRate;
    for (size_t i = 0; i < outCount; ++i) {
        const double pos = i * step;
        const size_t left = (size_t)pos;
        const size_t right = left + 1 < pcm.size() ? left + 1 : left;
        const double frac = pos - (double)left;
        out[i] = (int16_t)std::lround(pcm[left] * (1.0 - frac) + pcm[right] * frac);
    }
    return out;
}

std::string transcribeWavFile(const std::string& path, Transcriber& transcriber, int targetRate) {
    WavData wav = decodeWav(readFileBytes(path));
    if (wav.channels < 1 || wav.sampleRate < 1) throw WavFormatError("bad channel count or sample rate");

    std::vector<int16_t> mono = wav.samples;
    if (wav.channels > 1) {
        mono = toMonoPcm16(wav.samples.data(), wav.samples.size() / wav.channels, SampleFormat::Int16, wav.channels);
    }
    if (wav.sampleRate != targetRate) {
        logInfo(kComponent, strCat("Resampling ", path, " from ", wav.sampleRate, " to ", targetRate, " Hz"));
        mono = resampleLinear(mono, wav.sampleRate, targetRate);
    }

    logInfo(kComponent, strCat("Transcribing ", path, " (", mono.size() * 1000 / targetRate, " ms)"));
    return trimText(transcriber.transcribe(encodeWav(mono, targetRate)));
}

bool appendTranscriptLine(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::out | std::ios::app);
    if (!f) return false;
    f << text << "\n";
    return (bool)f;
}
