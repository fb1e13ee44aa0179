#include "config/app_config.hpp"
#include "audio/voice_classifier.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <getopt.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

static const double kMaxSilenceHoldSec = 60.0;
static const double kMaxInactivityMultiplier = 100.0;
static const double kMaxChannelSeconds = 60.0;

static int parseInt(const std::string& name, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || errno != 0 || *end != '\0' || v < -2147483647L || v > 2147483647L) {
        throw ConfigError(name + ": expected an integer, got '" + value + "'");
    }
    return (int)v;
}

static double parseDouble(const std::string& name, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(value.c_str(), &end);
    if (value.empty() || errno != 0 || *end != '\0' || !std::isfinite(v)) {
        throw ConfigError(name + ": expected a number, got '" + value + "'");
    }
    return v;
}

static bool parseBool(const std::string& name, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw ConfigError(name + ": expected a boolean, got '" + value + "'");
}

static SampleFormat parseFormat(const std::string& name, const std::string& value) {
    SampleFormat f;
    if (!parseSampleFormat(value, f)) throw ConfigError(name + ": expected int16, int32 or float32, got '" + value + "'");
    return f;
}

int AppConfig::silenceHoldMs() const { return (int)std::lround(vad.silenceHoldSec * 1000.0); }

int AppConfig::maxSilenceFrames() const {
    const int hold = silenceHoldMs();
    return (hold + audio.frameMs - 1) / audio.frameMs;
}

int AppConfig::inactivityTimeoutMs() const {
    return (int)std::lround(vad.silenceHoldSec * vad.inactivityMultiplier * 1000.0);
}

size_t AppConfig::channelCapacityFrames() const {
    return (size_t)std::lround(audio.channelSeconds * 1000.0 / audio.frameMs);
}

void validateConfig(const AppConfig& c) {
    if (!VoiceClassifier::isSupported(c.audio.sampleRate, 30)) {
        throw ConfigError("sample rate must be 8000, 16000, 32000 or 48000 Hz, got " + std::to_string(c.audio.sampleRate));
    }
    if (!VoiceClassifier::isSupported(16000, c.audio.frameMs)) {
        throw ConfigError("frame duration must be 10, 20 or 30 ms, got " + std::to_string(c.audio.frameMs));
    }
    if (c.audio.channels != 1 && c.audio.channels != 2) {
        throw ConfigError("channels must be 1 or 2, got " + std::to_string(c.audio.channels));
    }
    if (c.vad.aggressiveness < 0 || c.vad.aggressiveness > 3) {
        throw ConfigError("VAD aggressiveness must be 0-3, got " + std::to_string(c.vad.aggressiveness));
    }
    // Upper bounds keep the derived millisecond values inside int.
    if (!(c.vad.silenceHoldSec > 0.0) || c.vad.silenceHoldSec > kMaxSilenceHoldSec) {
        throw ConfigError(strCat("silence hold must be in (0, ", kMaxSilenceHoldSec, "] seconds"));
    }
    if (c.silenceHoldMs() < 1) throw ConfigError("silence hold must be at least 1 ms");
    if (!(c.vad.energyThreshold > 0.0f) || c.vad.energyThreshold > 1.0f) {
        throw ConfigError("energy threshold must be in (0, 1]");
    }
    if (!(c.vad.inactivityMultiplier >= 1.0) || c.vad.inactivityMultiplier > kMaxInactivityMultiplier) {
        throw ConfigError(strCat("inactivity multiplier must be in [1, ", kMaxInactivityMultiplier, "]"));
    }
    if (!(c.audio.channelSeconds > 0.0) || c.audio.channelSeconds > kMaxChannelSeconds ||
        c.channelCapacityFrames() < 1) {
        throw ConfigError("frame channel must hold at least one frame");
    }
    if (c.sink.queueCapacity < 1) throw ConfigError("utterance queue must hold at least one utterance");
    if (c.sink.injector != "xdo" && c.sink.injector != "stdout") {
        throw ConfigError("injector must be 'xdo' or 'stdout', got '" + c.sink.injector + "'");
    }
    if (c.stt.threads < 1) throw ConfigError("whisper threads must be >= 1");
    if (c.control.port < 0 || c.control.port > 65535) throw ConfigError("control port must be 0-65535");
    if (c.joinTimeoutMs < 1) throw ConfigError("join timeout must be positive");

    LogLevel level;
    if (!parseLogLevel(c.logLevel, level)) throw ConfigError("unknown log level '" + c.logLevel + "'");
}

void applyEnvironment(AppConfig& c, const EnvLookup& lookup) {
    auto get = [&lookup](const char* name, std::string& out) {
        const char* v = lookup(name);
        if (!v || !*v) return false;
        out = v;
        return true;
    };

    std::string v;
    if (get("VOXKEY_SAMPLE_RATE", v)) c.audio.sampleRate = parseInt("VOXKEY_SAMPLE_RATE", v);
    if (get("VOXKEY_FRAME_MS", v)) c.audio.frameMs = parseInt("VOXKEY_FRAME_MS", v);
    if (get("VOXKEY_CHANNELS", v)) c.audio.channels = parseInt("VOXKEY_CHANNELS", v);
    if (get("VOXKEY_CAPTURE_FORMAT", v)) c.audio.captureFormat = parseFormat("VOXKEY_CAPTURE_FORMAT", v);
    if (get("VOXKEY_DEVICE", v)) c.audio.deviceIndex = parseInt("VOXKEY_DEVICE", v);
    if (get("VOXKEY_VAD_AGGRESSIVENESS", v)) c.vad.aggressiveness = parseInt("VOXKEY_VAD_AGGRESSIVENESS", v);
    if (get("VOXKEY_SILENCE_HOLD", v)) c.vad.silenceHoldSec = parseDouble("VOXKEY_SILENCE_HOLD", v);
    if (get("VOXKEY_ENERGY_THRESHOLD", v)) c.vad.energyThreshold = (float)parseDouble("VOXKEY_ENERGY_THRESHOLD", v);
    if (get("VOXKEY_ENERGY_GATE", v)) c.vad.energyGate = parseBool("VOXKEY_ENERGY_GATE", v);
    if (get("VOXKEY_INACTIVITY_MULTIPLIER", v)) {
        c.vad.inactivityMultiplier = parseDouble("VOXKEY_INACTIVITY_MULTIPLIER", v);
    }
    if (get("VOXKEY_MODEL", v)) c.stt.modelPath = v;
    if (get("VOXKEY_LANGUAGE", v)) c.stt.language = v;
    if (get("VOXKEY_THREADS", v)) c.stt.threads = parseInt("VOXKEY_THREADS", v);
    if (get("VOXKEY_INJECTOR", v)) c.sink.injector = v;
    if (get("VOXKEY_SAVE_DIR", v)) c.sink.saveDir = v;
    if (get("VOXKEY_TRANSCRIPT_FILE", v)) c.sink.transcriptFile = v;
    if (get("VOXKEY_CONTROL_PORT", v)) c.control.port = parseInt("VOXKEY_CONTROL_PORT", v);
    if (get("VOXKEY_LOG_LEVEL", v)) c.logLevel = v;
    if (get("VOXKEY_LOG_FILE", v)) c.logFile = v;
}

void applyEnvironment(AppConfig& config) {
    applyEnvironment(config, [](const char* name) -> const char* { return std::getenv(name); });
}

enum OptionId {
    kOptSampleRate = 1000,
    kOptFrameMs,
    kOptChannels,
    kOptCaptureFormat,
    kOptDevice,
    kOptChannelSeconds,
    kOptAggressiveness,
    kOptSilenceHold,
    kOptEnergyThreshold,
    kOptEnergyGate,
    kOptInactivity,
    kOptModel,
    kOptLanguage,
    kOptThreads,
    kOptQueue,
    kOptSaveDir,
    kOptTranscriptFile,
    kOptInjector,
    kOptControlIp,
    kOptControlPort,
    kOptJoinTimeout,
    kOptLogLevel,
    kOptLogFile,
    kOptListDevices,
    kOptTranscribe,
    kOptListen,
    kOptNoInteractive,
};

bool parseCommandLine(AppConfig& c, int argc, char** argv) {
    static const option kOptions[] = {
        {"sample-rate", required_argument, nullptr, kOptSampleRate},
        {"frame-ms", required_argument, nullptr, kOptFrameMs},
        {"channels", required_argument, nullptr, kOptChannels},
        {"capture-format", required_argument, nullptr, kOptCaptureFormat},
        {"device", required_argument, nullptr, kOptDevice},
        {"channel-seconds", required_argument, nullptr, kOptChannelSeconds},
        {"aggressiveness", required_argument, nullptr, kOptAggressiveness},
        {"silence-hold", required_argument, nullptr, kOptSilenceHold},
        {"energy-threshold", required_argument, nullptr, kOptEnergyThreshold},
        {"energy-gate", no_argument, nullptr, kOptEnergyGate},
        {"inactivity-multiplier", required_argument, nullptr, kOptInactivity},
        {"model", required_argument, nullptr, kOptModel},
        {"language", required_argument, nullptr, kOptLanguage},
        {"threads", required_argument, nullptr, kOptThreads},
        {"queue", required_argument, nullptr, kOptQueue},
        {"save-dir", required_argument, nullptr, kOptSaveDir},
        {"transcript-file", required_argument, nullptr, kOptTranscriptFile},
        {"injector", required_argument, nullptr, kOptInjector},
        {"control-ip", required_argument, nullptr, kOptControlIp},
        {"control-port", required_argument, nullptr, kOptControlPort},
        {"join-timeout-ms", required_argument, nullptr, kOptJoinTimeout},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"log-file", required_argument, nullptr, kOptLogFile},
        {"list-devices", no_argument, nullptr, kOptListDevices},
        {"transcribe", required_argument, nullptr, kOptTranscribe},
        {"listen", no_argument, nullptr, kOptListen},
        {"no-interactive", no_argument, nullptr, kOptNoInteractive},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // 0 makes glibc reset its scanner, so the parser can run more than once.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":vh", kOptions, nullptr)) != -1) {
        const std::string arg = optarg ? optarg : "";
        switch (opt) {
            case kOptSampleRate: c.audio.sampleRate = parseInt("--sample-rate", arg); break;
            case kOptFrameMs: c.audio.frameMs = parseInt("--frame-ms", arg); break;
            case kOptChannels: c.audio.channels = parseInt("--channels", arg); break;
            case kOptCaptureFormat: c.audio.captureFormat = parseFormat("--capture-format", arg); break;
            case kOptDevice: c.audio.deviceIndex = parseInt("--device", arg); break;
            case kOptChannelSeconds: c.audio.channelSeconds = parseDouble("--channel-seconds", arg); break;
            case kOptAggressiveness: c.vad.aggressiveness = parseInt("--aggressiveness", arg); break;
            case kOptSilenceHold: c.vad.silenceHoldSec = parseDouble("--silence-hold", arg); break;
            case kOptEnergyThreshold: c.vad.energyThreshold = (float)parseDouble("--energy-threshold", arg); break;
            case kOptEnergyGate: c.vad.energyGate = true; break;
            case kOptInactivity: c.vad.inactivityMultiplier = parseDouble("--inactivity-multiplier", arg); break;
            case kOptModel: c.stt.modelPath = arg; break;
            case kOptLanguage: c.stt.language = arg; break;
            case kOptThreads: c.stt.threads = parseInt("--threads", arg); break;
            case kOptQueue: {
                const int q = parseInt("--queue", arg);
                if (q < 1) throw ConfigError("--queue must be at least 1");
                c.sink.queueCapacity = (size_t)q;
                break;
            }
            case kOptSaveDir: c.sink.saveDir = arg; break;
            case kOptTranscriptFile: c.sink.transcriptFile = arg; break;
            case kOptInjector: c.sink.injector = arg; break;
            case kOptControlIp: c.control.bindIp = arg; break;
            case kOptControlPort: c.control.port = parseInt("--control-port", arg); break;
            case kOptJoinTimeout: c.joinTimeoutMs = parseInt("--join-timeout-ms", arg); break;
            case kOptLogLevel: c.logLevel = arg; break;
            case kOptLogFile: c.logFile = arg; break;
            case kOptListDevices: c.listDevices = true; break;
            case kOptTranscribe: c.transcribeFile = arg; break;
            case kOptListen: c.listenOnStart = true; break;
            case kOptNoInteractive: c.interactive = false; break;
            case 'v': c.logLevel = "debug"; break;
            case 'h': return false;
            case ':': throw ConfigError(std::string("missing value for ") + argv[optind - 1]);
            default: throw ConfigError(std::string("unknown option ") + argv[optind - 1]);
        }
    }

    if (optind < argc) throw ConfigError(std::string("unexpected argument ") + argv[optind]);
    return true;
}

std::string usage(const char* program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "\n"
       << "Audio:\n"
       << "  --sample-rate HZ            8000, 16000, 32000 or 48000 (default 16000)\n"
       << "  --frame-ms MS               10, 20 or 30 (default 30)\n"
       << "  --channels N                device channels, downmixed to mono (default 1)\n"
       << "  --capture-format F          int16, int32 or float32 (default int16)\n"
       << "  --device INDEX              input device, see --list-devices (default: system default)\n"
       << "  --channel-seconds S         frame backlog before the oldest is dropped (default 2.0)\n"
       << "\n"
       << "Voice activity:\n"
       << "  --aggressiveness N          VAD mode 0-3 (default 3)\n"
       << "  --silence-hold S            trailing silence that ends an utterance (default 1.0)\n"
       << "  --energy-threshold X        mean absolute amplitude for the energy gate (default 0.01)\n"
       << "  --energy-gate               require the energy threshold to start an utterance\n"
       << "  --inactivity-multiplier X   watchdog timeout as a multiple of the hold (default 2.0)\n"
       << "\n"
       << "Transcription and output:\n"
       << "  --model PATH                whisper model file\n"
       << "  --language CODE             transcription language (default en)\n"
       << "  --threads N                 whisper threads (default 4)\n"
       << "  --queue N                   utterances waiting for transcription (default 8)\n"
       << "  --save-dir DIR              also save every utterance as WAV\n"
       << "  --transcript-file FILE      append every transcript to FILE\n"
       << "  --injector xdo|stdout       where text goes (default xdo)\n"
       << "\n"
       << "Control:\n"
       << "  --control-ip IP             UDP command address (default 127.0.0.1)\n"
       << "  --control-port PORT         UDP command port, 0 disables (default 3939)\n"
       << "  --listen                    start in listening mode\n"
       << "  --no-interactive            do not read commands from stdin\n"
       << "  --join-timeout-ms MS        wait before a stopping worker is reported stuck (default 2000)\n"
       << "\n"
       << "General:\n"
       << "  --list-devices              list input devices and exit\n"
       << "  --transcribe FILE           transcribe a WAV file, print the text and exit\n"
       << "  --log-level LEVEL           debug, info, warn or error (default info)\n"
       << "  --log-file FILE             also write log lines to FILE\n"
       << "  -v, --verbose               same as --log-level debug\n"
       << "  -h, --help                  show this help\n";
    return ss.str();
}

std::string describeConfig(const AppConfig& c) {
    std::ostringstream ss;
    ss << c.audio.sampleRate << " Hz, " << c.audio.frameMs << " ms frames, VAD mode " << c.vad.aggressiveness
       << ", silence hold " << c.silenceHoldMs() << " ms (" << c.maxSilenceFrames() << " frames), watchdog "
       << c.inactivityTimeoutMs() << " ms, energy gate " << (c.vad.energyGate ? "on" : "off") << " ("
       << c.vad.energyThreshold << "), channel " << c.channelCapacityFrames() << " frames";
    return ss.str();
}
