#include "audio/wav.hpp"
#include "core/errors.hpp"

#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

static void putU32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back((uint8_t)(v & 0xff));
    out.push_back((uint8_t)((v >> 8) & 0xff));
    out.push_back((uint8_t)((v >> 16) & 0xff));
    out.push_back((uint8_t)((v >> 24) & 0xff));
}

static void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xff));
    out.push_back((uint8_t)((v >> 8) & 0xff));
}

static void putTag(std::vector<uint8_t>& out, const char* tag) { out.insert(out.end(), tag, tag + 4); }

static uint32_t getU32(const std::vector<uint8_t>& b, size_t at) {
    return (uint32_t)b[at] | ((uint32_t)b[at + 1] << 8) | ((uint32_t)b[at + 2] << 16) | ((uint32_t)b[at + 3] << 24);
}

static uint16_t getU16(const std::vector<uint8_t>& b, size_t at) {
    return (uint16_t)(b[at] | (b[at + 1] << 8));
}

static bool tagAt(const std::vector<uint8_t>& b, size_t at, const char* tag) {
    return at + 4 <= b.size() && std::memcmp(&b[at], tag, 4) == 0;
}

std::vector<uint8_t> encodeWav(const std::vector<int16_t>& pcm, int sampleRate) {
    const uint16_t channels = 1;
    const uint16_t bitsPerSample = 16;
    const uint16_t blockAlign = channels * bitsPerSample / 8;
    const uint32_t dataSize = (uint32_t)(pcm.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + dataSize);

    putTag(out, "RIFF");
    putU32(out, 36 + dataSize);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    putU32(out, 16);
    putU16(out, 1);  // PCM
    putU16(out, channels);
    putU32(out, (uint32_t)sampleRate);
    putU32(out, (uint32_t)sampleRate * blockAlign);
    putU16(out, blockAlign);
    putU16(out, bitsPerSample);

    putTag(out, "data");
    putU32(out, dataSize);
    for (int16_t s : pcm) putU16(out, (uint16_t)s);

    return out;
}

WavData decodeWav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12 || !tagAt(bytes, 0, "RIFF") || !tagAt(bytes, 8, "WAVE")) {
        throw WavFormatError("not a RIFF/WAVE buffer");
    }

    WavData wav;
    bool haveFmt = false;
    size_t at = 12;

    while (at + 8 <= bytes.size()) {
        const uint32_t size = getU32(bytes, at + 4);
        const size_t body = at + 8;
        if (body + size > bytes.size()) throw WavFormatError("truncated chunk");

        if (tagAt(bytes, at, "fmt ")) {
            if (size < 16) throw WavFormatError("fmt chunk too small");
            if (getU16(bytes, body) != 1) throw WavFormatError("only PCM is supported");
            wav.channels = getU16(bytes, body + 2);
            wav.sampleRate = (int)getU32(bytes, body + 4);
            wav.bitsPerSample = getU16(bytes, body + 14);
            if (wav.bitsPerSample != 16) throw WavFormatError("only 16-bit samples are supported");
            haveFmt = true;
        } else if (tagAt(bytes, at, "data")) {
            if (!haveFmt) throw WavFormatError("data chunk before fmt chunk");
            wav.samples.resize(size / 2);
            for (size_t i = 0; i < wav.samples.size(); ++i) wav.samples[i] = (int16_t)getU16(bytes, body + i * 2);
            return wav;
        }

        // Chunks are word aligned.
        at = body + size + (size & 1);
    }

    throw WavFormatError("no data chunk");
}

std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path + " for reading");
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) throw std::runtime_error("failed reading " + path);
    return bytes;
}

void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot open " + path + " for writing");
    f.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    if (!f) throw std::runtime_error("failed writing " + path);
}
