#include "audio/frame.hpp"

#include <algorithm>
#include <cmath>

bool parseSampleFormat(const std::string& name, SampleFormat& out) {
    if (name == "int16") out = SampleFormat::Int16;
    else if (name == "int32") out = SampleFormat::Int32;
    else if (name == "float32") out = SampleFormat::Float32;
    else return false;
    return true;
}

const char* sampleFormatName(SampleFormat format) {
    switch (format) {
        case SampleFormat::Int16: return "int16";
        case SampleFormat::Int32: return "int32";
        case SampleFormat::Float32: return "float32";
    }
    return "int16";
}

size_t Utterance::sampleCount() const {
    size_t n = 0;
    for (const auto& f : frames) n += f.samples.size();
    return n;
}

int Utterance::durationMs() const {
    if (sampleRate <= 0) return 0;
    return (int)((sampleCount() * 1000) / (size_t)sampleRate);
}

std::vector<int16_t> Utterance::pcm() const {
    std::vector<int16_t> out;
    out.reserve(sampleCount());
    for (const auto& f : frames) out.insert(out.end(), f.samples.begin(), f.samples.end());
    return out;
}

static double sampleAt(const void* data, size_t index, SampleFormat format) {
    switch (format) {
        case SampleFormat::Int16:
            return (double)static_cast<const int16_t*>(data)[index];
        case SampleFormat::Int32:
            return (double)static_cast<const int32_t*>(data)[index] / 65536.0;
        case SampleFormat::Float32: {
            const float v = std::max(-1.0f, std::min(1.0f, static_cast<const float*>(data)[index]));
            return (double)v * 32767.0;
        }
    }
    return 0.0;
}

std::vector<int16_t> toMonoPcm16(const void* data, size_t frameCount, SampleFormat format, int channels) {
    std::vector<int16_t> out(frameCount, 0);
    if (!data || channels <= 0) return out;

    for (size_t i = 0; i < frameCount; ++i) {
        double acc = 0.0;
        for (int c = 0; c < channels; ++c) acc += sampleAt(data, i * (size_t)channels + (size_t)c, format);
        acc /= channels;

        const long v = std::lround(acc);
        out[i] = (int16_t)std::max(-32768L, std::min(32767L, v));
    }
    return out;
}

bool normalizeFrameLength(std::vector<int16_t>& samples, size_t expected) {
    if (samples.size() == expected) return false;
    samples.resize(expected, 0);
    return true;
}
