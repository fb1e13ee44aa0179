#ifndef CONTROLLER_HPP
#define CONTROLLER_HPP

#include "app/utterance_sink.hpp"
#include "audio/audio_capture.hpp"
#include "audio/frame_channel.hpp"
#include "audio/frame_source.hpp"
#include "audio/segmentation_worker.hpp"
#include "audio/utterance_segmenter.hpp"
#include "audio/voice_classifier.hpp"
#include "core/worker_thread.hpp"
#include "inject/text_injector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Owns the Stopped / Recording / Listening state.
//
// Every state change runs on one control thread, fed by a command queue.
// The public calls post a command and wait for its result; other components
// only observe the state through state() or the registered listeners.
class Controller {
public:
    enum class State { Stopped, Recording, Listening };

    using Listener = std::function<void(State from, State to)>;
    using CaptureFactory = std::function<std::unique_ptr<AudioCapture>()>;
    using DetectorFactory = std::function<std::unique_ptr<SpeechDetector>()>;

    struct Config {
        FrameSource::Config source;
        UtteranceSegmenter::Config segmenter;
        VoiceClassifier::Config classifier;

        size_t channelCapacity = 66;
        std::chrono::milliseconds popTimeout{500};
        std::chrono::milliseconds joinTimeout{2000};
    };

    Controller(Config config, CaptureFactory captureFactory, DetectorFactory detectorFactory,
               UtteranceSink& sink, TextInjector& injector);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // Each returns true when the state changed.
    bool startRecording();
    bool stopRecording();
    bool toggleRecording();
    bool startListening();
    bool stopListening();
    bool toggleListening();
    bool stop();

    // Stops the active mode and the control thread. Idempotent.
    void shutdown();

    State state() const { return static_cast<State>(state_.load()); }

    // Listeners run on the control thread.
    void addListener(Listener listener);

private:
    enum class Command {
        StartRecording,
        StopRecording,
        ToggleRecording,
        StartListening,
        StopListening,
        ToggleListening,
        Stop,
        StreamEnded,
    };

    struct Pending {
        Command command;
        uint64_t session = 0;
        std::shared_ptr<std::promise<bool>> done;
    };

    struct Session {
        uint64_t id = 0;
        State mode = State::Stopped;
        std::unique_ptr<AudioCapture> capture;
        std::shared_ptr<FrameChannel> channel;
        std::unique_ptr<FrameSource> source;
        std::unique_ptr<SegmentationWorker> worker;
    };

    bool post(Command command, uint64_t session = 0, bool wait = true);
    void controlLoop();
    bool execute(Command command, uint64_t session);

    bool enter(State mode);
    bool leave(State mode);
    void beginSession(State mode);
    void endSession();
    void reapParked();
    void setState(State next);

    Config config_;
    CaptureFactory captureFactory_;
    DetectorFactory detectorFactory_;
    UtteranceSink& sink_;
    TextInjector& injector_;

    std::atomic<int> state_{static_cast<int>(State::Stopped)};

    std::mutex listenerMutex_;
    std::vector<Listener> listeners_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<Pending> commands_;
    bool closing_ = false;
    bool closed_ = false;

    std::atomic<std::thread::id> controlThreadId_{};
    WorkerThread controlThread_;

    // Only touched on the control thread.
    std::unique_ptr<Session> session_;
    // Sessions whose worker missed joinTimeout, kept alive until it returns.
    std::vector<std::unique_ptr<Session>> parked_;
    uint64_t nextSession_ = 1;
};

const char* controllerStateName(Controller::State state);

#endif
