#include "headers.hpp"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_quit{false};

static void onSignal(int) { g_quit = true; }

static void printMenu() {
    std::cout << "\n=== voxkey ===\n"
              << "  r  toggle recording (manual start/stop)\n"
              << "  l  toggle listening (voice activated)\n"
              << "  s  show status\n"
              << "  q  quit\n"
              << "==============\n" << std::endl;
}

static Controller::Config controllerConfig(const AppConfig& config) {
    Controller::Config cc;
    cc.source.format = config.frameFormat();
    cc.source.channels = config.audio.channels;
    cc.source.captureFormat = config.audio.captureFormat;
    cc.source.deviceIndex = config.audio.deviceIndex;

    cc.segmenter.sampleRate = config.audio.sampleRate;
    cc.segmenter.frameMs = config.audio.frameMs;
    cc.segmenter.silenceHoldMs = config.silenceHoldMs();
    cc.segmenter.inactivityTimeoutMs = config.inactivityTimeoutMs();
    cc.segmenter.energyGate = config.vad.energyGate;

    cc.classifier.sampleRate = config.audio.sampleRate;
    cc.classifier.frameMs = config.audio.frameMs;
    cc.classifier.energyThreshold = config.vad.energyThreshold;

    cc.channelCapacity = config.channelCapacityFrames();
    cc.joinTimeout = std::chrono::milliseconds(config.joinTimeoutMs);
    return cc;
}

static int listDevices() {
    try {
        for (const auto& d : PortAudioCapture::listDevices()) {
            std::cout << (d.isDefault ? "* " : "  ") << d.index << ": " << d.name << " [" << d.hostApi << "] "
                      << d.maxInputChannels << " ch, " << d.defaultSampleRate << " Hz\n";
        }
    } catch (const AudioDeviceError& e) {
        logError("Capture", e.what());
        return 1;
    }
    return 0;
}

static std::unique_ptr<Transcriber> makeTranscriber(const AppConfig& config) {
    WhisperSTT::Config sttConfig;
    sttConfig.modelPath = config.stt.modelPath;
    sttConfig.language = config.stt.language;
    sttConfig.threads = config.stt.threads;
    return std::make_unique<WhisperSTT>(sttConfig);
}

static int transcribeFile(const AppConfig& config) {
    try {
        std::unique_ptr<Transcriber> stt = makeTranscriber(config);
        const std::string text = transcribeWavFile(config.transcribeFile, *stt);
        if (text.empty()) {
            std::cout << "No speech recognised in " << config.transcribeFile << std::endl;
            return 0;
        }

        std::cout << "\nTranscription result:\n" << text << "\n" << std::endl;
        if (!config.sink.transcriptFile.empty()) {
            if (appendTranscriptLine(config.sink.transcriptFile, text)) {
                logInfo("Main", "Transcription saved to " + config.sink.transcriptFile);
            } else {
                logError("Main", "Could not write transcript file " + config.sink.transcriptFile);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        logError("Main", std::string("Error transcribing file: ") + e.what());
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    AppConfig config;
    try {
        applyEnvironment(config);
        if (!parseCommandLine(config, argc, argv)) {
            std::cout << usage(argv[0]);
            return 0;
        }
        validateConfig(config);
    } catch (const ConfigError& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }

    LogLevel level = LogLevel::Info;
    parseLogLevel(config.logLevel, level);
    setLogLevel(level);
    if (!config.logFile.empty() && !setLogFile(config.logFile)) {
        logWarn("Main", "Could not open log file " + config.logFile);
    }

    if (config.listDevices) return listDevices();
    if (!config.transcribeFile.empty()) return transcribeFile(config);

    if (config.audio.sampleRate != 16000) {
        logError("Config", "whisper transcription needs --sample-rate 16000");
        return 2;
    }
    logInfo("Main", describeConfig(config));

    // STT model init
    std::unique_ptr<Transcriber> stt;
    try {
        stt = makeTranscriber(config);
    } catch (const std::exception& e) {
        logError("Whisper STT", e.what());
        return 1;
    }

    std::unique_ptr<TextInjector> injector;
    if (config.sink.injector == "xdo") {
        try {
            injector = std::make_unique<XdoTextInjector>();
        } catch (const std::exception& e) {
            logWarn("Injector", std::string(e.what()) + ", printing transcripts instead");
        }
    }
    if (!injector) injector = std::make_unique<ConsoleTextInjector>(std::cout);

    UtteranceSink::Config sinkConfig;
    sinkConfig.queueCapacity = config.sink.queueCapacity;
    sinkConfig.saveDir = config.sink.saveDir;
    sinkConfig.transcriptFile = config.sink.transcriptFile;
    UtteranceSink sink(sinkConfig, *stt, *injector);
    sink.start();

    const int sampleRate = config.audio.sampleRate;
    const int aggressiveness = config.vad.aggressiveness;
    Controller controller(
        controllerConfig(config),
        [] { return std::unique_ptr<AudioCapture>(std::make_unique<PortAudioCapture>()); },
        [sampleRate, aggressiveness] {
            return std::unique_ptr<SpeechDetector>(std::make_unique<FvadDetector>(sampleRate, aggressiveness));
        },
        sink, *injector);

    controller.addListener([](Controller::State from, Controller::State to) {
        logInfo("Main", std::string("State: ") + controllerStateName(from) + " -> " + controllerStateName(to));
    });

    // Control server init
    std::unique_ptr<ControlServer> control;
    if (config.control.port != 0) {
        control = std::make_unique<ControlServer>(config.control.bindIp, config.control.port,
            [&controller](const std::string& command) {
                bool quit = false;
                const std::string reply = dispatchCommand(controller, command, quit);
                if (quit) g_quit = true;
                return reply;
            });
        try {
            control->start();
        } catch (const std::exception& e) {
            logWarn("Control", std::string(e.what()) + ", remote commands disabled");
            control.reset();
        }
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    if (config.listenOnStart) controller.startListening();

    bool interactive = config.interactive && ::isatty(STDIN_FILENO);
    if (interactive) printMenu();
    else logInfo("Main", "Running... (Ctrl+C to quit)");

    while (!g_quit.load()) {
        if (!interactive) {
            ::poll(nullptr, 0, 200);
            continue;
        }

        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, 200) <= 0) continue;

        std::string line;
        if (!std::getline(std::cin, line)) {
            // stdin closed: keep serving remote commands, or quit when there are none.
            interactive = false;
            if (!control) g_quit = true;
            continue;
        }

        bool quit = false;
        const std::string reply = dispatchCommand(controller, normalizeCommand(line), quit);
        if (quit) break;
        if (reply.find("\"error\"") != std::string::npos) printMenu();
        else std::cout << "State: " << controllerStateName(controller.state()) << std::endl;
    }

    logInfo("Main", "Shutting down...");
    if (control) control->stop();
    controller.shutdown();
    sink.stop(std::chrono::milliseconds(config.joinTimeoutMs));

    const UtteranceSink::Stats stats = sink.stats();
    logInfo("Main", strCat("Utterances: ", stats.received, " received, ", stats.transcribed, " transcribed, ",
                           stats.failed, " failed, ", stats.dropped, " dropped, ", stats.injected, " injected"));
    return 0;
}
