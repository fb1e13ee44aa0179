#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "audio/frame.hpp"

#include <cstddef>
#include <functional>
#include <string>

// All tunables, resolved once at startup: defaults, then VOXKEY_* environment
// variables, then command-line flags. Read-only afterwards.
struct AppConfig {
    struct Audio {
        int sampleRate = 16000;
        int frameMs = 30;
        int channels = 1;
        SampleFormat captureFormat = SampleFormat::Int16;
        int deviceIndex = -1;

        // Frame channel size, in seconds of audio.
        double channelSeconds = 2.0;
    };

    struct Vad {
        int aggressiveness = 3;
        double silenceHoldSec = 1.0;
        float energyThreshold = 0.01f;
        bool energyGate = false;
        double inactivityMultiplier = 2.0;
    };

    struct Stt {
        std::string modelPath = "models/whisper/ggml-base.en.bin";
        std::string language = "en";
        int threads = 4;
    };

    struct Sink {
        size_t queueCapacity = 8;
        std::string saveDir;
        std::string transcriptFile;
        std::string injector = "xdo";
    };

    struct Control {
        std::string bindIp = "127.0.0.1";
        int port = 3939;
    };

    Audio audio;
    Vad vad;
    Stt stt;
    Sink sink;
    Control control;

    int joinTimeoutMs = 2000;
    std::string logLevel = "info";
    std::string logFile;

    // Transcribe this WAV file and exit instead of capturing.
    std::string transcribeFile;

    bool listDevices = false;
    bool listenOnStart = false;
    bool interactive = true;

    // Derived values.
    FrameFormat frameFormat() const { return FrameFormat{audio.sampleRate, audio.frameMs}; }
    int silenceHoldMs() const;
    int maxSilenceFrames() const;
    int inactivityTimeoutMs() const;
    size_t channelCapacityFrames() const;
};

// Throws ConfigError on the first invalid value.
void validateConfig(const AppConfig& config);

using EnvLookup = std::function<const char*(const char*)>;

// Reads VOXKEY_* variables. Throws ConfigError on malformed values.
void applyEnvironment(AppConfig& config, const EnvLookup& lookup);
void applyEnvironment(AppConfig& config);

// Returns false when --help was handled and the program should exit.
// Throws ConfigError on unknown flags or malformed values.
bool parseCommandLine(AppConfig& config, int argc, char** argv);

std::string usage(const char* program);

std::string describeConfig(const AppConfig& config);

#endif
