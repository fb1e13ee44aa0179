#ifndef WAV_HPP
#define WAV_HPP

#include <cstdint>
#include <string>
#include <vector>

struct WavData {
    int sampleRate = 0;
    int channels = 0;
    int bitsPerSample = 0;
    std::vector<int16_t> samples;
};

// RIFF/WAVE, PCM, mono, 16-bit little-endian.
std::vector<uint8_t> encodeWav(const std::vector<int16_t>& pcm, int sampleRate);

// Accepts 16-bit PCM only; skips unknown chunks. Throws WavFormatError.
WavData decodeWav(const std::vector<uint8_t>& bytes);

// Throws std::runtime_error when the file cannot be read.
std::vector<uint8_t> readFileBytes(const std::string& path);

// Throws std::runtime_error when the file cannot be written.
void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes);

#endif
