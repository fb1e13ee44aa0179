#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Invalid or unsupported configuration, raised during startup validation.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Capture device could not be opened, started or enumerated.
class AudioDeviceError : public std::runtime_error {
public:
    explicit AudioDeviceError(const std::string& what) : std::runtime_error(what) {}
};

// The transcription collaborator failed for one utterance.
class TranscriptionError : public std::runtime_error {
public:
    explicit TranscriptionError(const std::string& what) : std::runtime_error(what) {}
};

class WavFormatError : public std::runtime_error {
public:
    explicit WavFormatError(const std::string& what) : std::runtime_error(what) {}
};

#endif
