#ifndef FRAME_HPP
#define FRAME_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class SampleFormat { Int16, Int32, Float32 };

bool parseSampleFormat(const std::string& name, SampleFormat& out);
const char* sampleFormatName(SampleFormat format);

// Rate and duration shared by every frame of a session.
struct FrameFormat {
    int sampleRate = 16000;
    int frameMs = 30;

    size_t samplesPerFrame() const { return (size_t)sampleRate * (size_t)frameMs / 1000; }
    size_t bytesPerFrame() const { return samplesPerFrame() * sizeof(int16_t); }
};

// One block of mono 16-bit PCM, stamped when the capture callback saw it.
struct Frame {
    std::vector<int16_t> samples;
    std::chrono::steady_clock::time_point captured{};
};

// Frames between a speech onset and the silence hold, in arrival order.
struct Utterance {
    std::vector<Frame> frames;
    int sampleRate = 16000;

    bool empty() const { return frames.empty(); }
    size_t sampleCount() const;
    int durationMs() const;

    // Concatenated samples of all frames.
    std::vector<int16_t> pcm() const;
};

// Converts an interleaved device block to mono int16. Multi-channel input is averaged.
std::vector<int16_t> toMonoPcm16(const void* data, size_t frameCount, SampleFormat format, int channels);

// Pads with silence or truncates to exactly `expected` samples. Returns true if the length changed.
bool normalizeFrameLength(std::vector<int16_t>& samples, size_t expected);

#endif
