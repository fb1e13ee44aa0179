#ifndef FILE_TRANSCRIPTION_HPP
#define FILE_TRANSCRIPTION_HPP

#include "stt/transcriber.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Transcribes a 16-bit PCM WAV file in one call. Multi-channel audio is
// averaged to mono and other rates are linearly resampled to `targetRate`.
// Throws std::runtime_error when the file cannot be read, WavFormatError on a
// bad WAV and whatever the transcriber throws. Returns the trimmed text.
std::string transcribeWavFile(const std::string& path, Transcriber& transcriber, int targetRate = 16000);

std::vector<int16_t> resampleLinear(const std::vector<int16_t>& pcm, int fromRate, int toRate);

// Appends `text` and a newline. Returns false when the file cannot be opened.
bool appendTranscriptLine(const std::string& path, const std::string& text);

#endif
