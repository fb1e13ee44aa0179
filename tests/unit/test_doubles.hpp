#ifndef TEST_DOUBLES_HPP
#define TEST_DOUBLES_HPP

#include "audio/audio_capture.hpp"
#include "audio/frame.hpp"
#include "audio/voice_classifier.hpp"
#include "core/errors.hpp"
#include "inject/text_injector.hpp"
#include "stt/transcriber.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Treats a frame as speech when its first sample is non-zero.
class MarkerDetector : public SpeechDetector {
public:
    bool isSpeech(const int16_t* samples, size_t count) override {
        ++calls;
        return count > 0 && samples[0] != 0;
    }

    int calls = 0;
};

inline std::vector<int16_t> speechSamples(size_t n, int16_t amplitude = 8000) {
    std::vector<int16_t> s(n);
    for (size_t i = 0; i < n; ++i) s[i] = (i % 2 == 0) ? amplitude : (int16_t)-amplitude;
    return s;
}

inline std::vector<int16_t> silenceSamples(size_t n) { return std::vector<int16_t>(n, 0); }

inline Frame makeFrame(std::vector<int16_t> samples) {
    Frame f;
    f.samples = std::move(samples);
    f.captured = std::chrono::steady_clock::now();
    return f;
}

// Delivers a fixed list of int16 blocks from its own thread, then idles until stopped.
class ScriptedCapture : public AudioCapture {
public:
    explicit ScriptedCapture(std::vector<std::vector<int16_t>> blocks) : blocks_(std::move(blocks)) {}
    ~ScriptedCapture() override { stop(); }

    void open(const CaptureParams& params, BlockCallback onBlock, FinishedCallback onFinished) override {
        if (failOpen) throw AudioDeviceError("scripted open failure");
        params_ = params;
        onBlock_ = std::move(onBlock);
        onFinished_ = std::move(onFinished);
        opened = true;
    }

    void start() override {
        active_ = true;
        thread_ = std::thread([this] {
            for (const auto& b : blocks_) {
                if (!active_.load()) return;
                onBlock_(b.data(), b.size(), SampleFormat::Int16, 1);
                ++delivered;
            }
            if (loseDeviceAtEnd && active_.load()) {
                onFinished_();
                return;
            }
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !active_.load(); });
        });
    }

    void stop() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_.exchange(false) && !thread_.joinable()) return;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
        ++stops;
    }

    bool isActive() const override { return active_.load(); }
    size_t takeStatusEvents() override { return statusEvents.exchange(0); }

    bool allDelivered() const { return delivered.load() == blocks_.size(); }

    bool failOpen = false;
    bool loseDeviceAtEnd = false;
    bool opened = false;
    std::atomic<size_t> delivered{0};
    std::atomic<size_t> statusEvents{0};
    std::atomic<int> stops{0};

private:
    std::vector<std::vector<int16_t>> blocks_;
    CaptureParams params_;
    BlockCallback onBlock_;
    FinishedCallback onFinished_;

    std::atomic<bool> active_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

// Returns scripted texts in order; "!fail" entries throw TranscriptionError.
class FakeTranscriber : public Transcriber {
public:
    explicit FakeTranscriber(std::vector<std::string> script) : script_(std::move(script)) {}

    std::string transcribe(const std::vector<uint8_t>& wav) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lastWav = wav;
        const size_t i = calls++;
        const std::string r = i < script_.size() ? script_[i] : std::string("text");
        if (r == "!fail") throw TranscriptionError("service unavailable");
        return r;
    }

    size_t callCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls;
    }

    std::vector<uint8_t> lastWav;

private:
    std::mutex mutex_;
    std::vector<std::string> script_;
    size_t calls = 0;
};

class RecordingInjector : public TextInjector {
public:
    bool inject(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        texts.push_back(text);
        return injectResult;
    }

    WindowHandle activeWindow() override { return window; }

    bool focusWindow(WindowHandle w) override {
        std::lock_guard<std::mutex> lock(mutex_);
        focused.push_back(w);
        return focusResult;
    }

    std::vector<std::string> injected() {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts;
    }

    WindowHandle window = 42;
    bool injectResult = true;
    bool focusResult = true;
    std::vector<std::string> texts;
    std::vector<WindowHandle> focused;

private:
    std::mutex mutex_;
};

// Polls `pred` until it holds or the deadline passes.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

#endif
