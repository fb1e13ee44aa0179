#ifndef UTTERANCE_SINK_HPP
#define UTTERANCE_SINK_HPP

#include "audio/frame.hpp"
#include "core/worker_thread.hpp"
#include "inject/text_injector.hpp"
#include "stt/transcriber.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

// Transcribes completed utterances and injects the text, on its own thread.
//
// A failed transcription drops that utterance only; the queue keeps
// accepting and processing later ones. No retries happen here.
class UtteranceSink {
public:
    struct Config {
        size_t queueCapacity = 8;

        // When set, every utterance is also written there as a WAV file.
        std::string saveDir;
        // When set, every transcript is appended there as one line.
        std::string transcriptFile;

        std::chrono::milliseconds popTimeout{1000};
    };

    struct Stats {
        size_t received = 0;
        size_t dropped = 0;
        size_t transcribed = 0;
        size_t failed = 0;
        size_t empty = 0;
        size_t injected = 0;
        size_t injectFailed = 0;
    };

    UtteranceSink(Config config, Transcriber& transcriber, TextInjector& injector);
    ~UtteranceSink();

    UtteranceSink(const UtteranceSink&) = delete;
    UtteranceSink& operator=(const UtteranceSink&) = delete;

    void start();
    // Finishes every queued utterance before returning, logging every
    // `progressInterval` while a transcription is still running. Idempotent.
    void stop(std::chrono::milliseconds progressInterval);

    // Returns false when the sink is stopped. A full queue drops its oldest entry.
    bool submit(Utterance&& utterance);

    // Window that should receive text; 0 injects into whatever is focused.
    void setTargetWindow(WindowHandle window);

    // Runs the whole transcribe / inject step for one utterance on the calling thread.
    bool process(const Utterance& utterance);

    // Blocks until nothing is queued or in flight.
    bool waitIdle(std::chrono::milliseconds timeout);

    Stats stats() const;
    size_t pending() const;

private:
    void run();
    void saveAudio(const std::vector<uint8_t>& wav, size_t seq);
    void appendTranscript(const std::string& text);

    Config config_;
    Transcriber& transcriber_;
    TextInjector& injector_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idleCv_;
    std::deque<Utterance> queue_;
    bool busy_ = false;
    bool accepting_ = false;
    bool stopRequested_ = false;
    WindowHandle target_ = 0;
    Stats stats_;
    size_t seq_ = 0;

    WorkerThread thread_;
};

// Strips leading and trailing whitespace.
std::string trimText(const std::string& text);

#endif
