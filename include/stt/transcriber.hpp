#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include <cstdint>
#include <string>
#include <vector>

// Turns one WAV-encoded utterance into text.
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Throws TranscriptionError on failure. Empty text means nothing was recognised.
    virtual std::string transcribe(const std::vector<uint8_t>& wav) = 0;
};

#endif
