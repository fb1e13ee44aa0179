#include "app/utterance_sink.hpp"
#include "app/file_transcription.hpp"
#include "audio/wav.hpp"
#include "core/log.hpp"

#include <exception>
#include <utility>

static const char* kComponent = "Sink";

std::string trimText(const std::string& text) {
    const char* ws = " \t\r\n";
    const size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

// Constructor
UtteranceSink::UtteranceSink(Config config, Transcriber& transcriber, TextInjector& injector)
    : config_(std::move(config)), transcriber_(transcriber), injector_(injector) {
    if (config_.queueCapacity == 0) config_.queueCapacity = 1;
}

// Destructor
UtteranceSink::~UtteranceSink() { stop(std::chrono::milliseconds(5000)); }

void UtteranceSink::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accepting_) return;
        accepting_ = true;
        stopRequested_ = false;
    }
    thread_.start(kComponent, [this] { run(); });
}

void UtteranceSink::stop(std::chrono::milliseconds progressInterval) {
    size_t queued = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ && !thread_.joinable()) return;
        accepting_ = false;
        stopRequested_ = true;
        queued = queue_.size() + (busy_ ? 1 : 0);
    }
    cv_.notify_all();

    if (queued > 0) logInfo(kComponent, strCat("Finishing ", queued, " pending utterance(s) before exit"));
    thread_.join(progressInterval);
}

bool UtteranceSink::submit(Utterance&& utterance) {
    if (utterance.empty()) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            logWarn(kComponent, "Sink stopped, utterance discarded");
            return false;
        }

        ++stats_.received;
        if (queue_.size() >= config_.queueCapacity) {
            queue_.pop_front();
            ++stats_.dropped;
            logWarn(kComponent, "Transcription backlog full, dropped oldest utterance");
        }
        queue_.push_back(std::move(utterance));
    }
    cv_.notify_one();
    return true;
}

void UtteranceSink::setTargetWindow(WindowHandle window) {
    std::lock_guard<std::mutex> lock(mutex_);
    target_ = window;
}

UtteranceSink::Stats UtteranceSink::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

size_t UtteranceSink::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + (busy_ ? 1 : 0);
}

bool UtteranceSink::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
}

void UtteranceSink::run() {
    for (;;) {
        Utterance u;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, config_.popTimeout, [this] { return !queue_.empty() || stopRequested_; });

            if (queue_.empty()) {
                if (stopRequested_) break;
                continue;
            }
            u = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        process(u);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idleCv_.notify_all();
    }
    idleCv_.notify_all();
}

bool UtteranceSink::process(const Utterance& utterance) {
    size_t seq = 0;
    WindowHandle target = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq = ++seq_;
        target = target_;
    }

    const std::vector<uint8_t> wav = encodeWav(utterance.pcm(), utterance.sampleRate);
    if (!config_.saveDir.empty()) saveAudio(wav, seq);

    logInfo(kComponent, strCat("Transcribing utterance #", seq, " (", utterance.durationMs(), " ms)"));

    std::string text;
    try {
        text = trimText(transcriber_.transcribe(wav));
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failed;
        logError(kComponent, strCat("Transcription of utterance #", seq, " failed, dropping it: ", e.what()));
        return false;
    }

    if (text.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.empty;
        logInfo(kComponent, strCat("Utterance #", seq, " produced no text"));
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.transcribed;
    }
    logInfo(kComponent, "STT: " + text);
    if (!config_.transcriptFile.empty()) appendTranscript(text);

    if (target != 0 && !injector_.focusWindow(target)) {
        logWarn(kComponent, "Could not focus the original window, injecting into the current one");
    }

    const bool ok = injector_.inject(text);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ok) ++stats_.injected;
        else ++stats_.injectFailed;
    }
    if (!ok) logError(kComponent, strCat("Text injection failed for utterance #", seq));
    return ok;
}

void UtteranceSink::saveAudio(const std::vector<uint8_t>& wav, size_t seq) {
    const std::string path = config_.saveDir + "/utterance_" + std::to_string(seq) + ".wav";
    try {
        writeFileBytes(path, wav);
        logDebug(kComponent, "Saved " + path);
    } catch (const std::exception& e) {
        logWarn(kComponent, std::string("Could not save utterance audio: ") + e.what());
    }
}

void UtteranceSink::appendTranscript(const std::string& text) {
    if (!appendTranscriptLine(config_.transcriptFile, text)) {
        logWarn(kComponent, "Could not write transcript file " + config_.transcriptFile);
    }
}
