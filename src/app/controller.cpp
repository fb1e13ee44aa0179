#include "app/controller.hpp"
#include "core/log.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

static const char* kComponent = "Controller";

const char* controllerStateName(Controller::State state) {
    switch (state) {
        case Controller::State::Stopped: return "stopped";
        case Controller::State::Recording: return "recording";
        case Controller::State::Listening: return "listening";
    }
    return "stopped";
}

// Constructor
Controller::Controller(Config config, CaptureFactory captureFactory, DetectorFactory detectorFactory,
                       UtteranceSink& sink, TextInjector& injector)
    : config_(config),
      captureFactory_(std::move(captureFactory)),
      detectorFactory_(std::move(detectorFactory)),
      sink_(sink),
      injector_(injector) {
    controlThread_.start(kComponent, [this] { controlLoop(); });
}

// Destructor
Controller::~Controller() { shutdown(); }

bool Controller::startRecording() { return post(Command::StartRecording); }
bool Controller::stopRecording() { return post(Command::StopRecording); }
bool Controller::toggleRecording() { return post(Command::ToggleRecording); }
bool Controller::startListening() { return post(Command::StartListening); }
bool Controller::stopListening() { return post(Command::StopListening); }
bool Controller::toggleListening() { return post(Command::ToggleListening); }
bool Controller::stop() { return post(Command::Stop); }

void Controller::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.push_back(std::move(listener));
}

void Controller::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (closing_) return;
        closing_ = true;
    }
    queueCv_.notify_all();

    // The loop stops any active mode and waits for parked workers before it exits.
    controlThread_.join(config_.joinTimeout);
    logInfo(kComponent, "Shut down");
}

bool Controller::post(Command command, uint64_t session, bool wait) {
    // Called from a listener: run inline instead of waiting on ourselves.
    if (std::this_thread::get_id() == controlThreadId_.load()) return execute(command, session);

    Pending p;
    p.command = command;
    p.session = session;
    std::future<bool> result;
    if (wait) {
        p.done = std::make_shared<std::promise<bool>>();
        result = p.done->get_future();
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (closing_ || closed_) return false;
        commands_.push_back(std::move(p));
    }
    queueCv_.notify_one();

    return wait ? result.get() : true;
}

void Controller::controlLoop() {
    controlThreadId_ = std::this_thread::get_id();

    for (;;) {
        Pending p;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this] { return !commands_.empty() || closing_; });
            if (commands_.empty()) {
                closed_ = true;
                break;
            }
            p = std::move(commands_.front());
            commands_.pop_front();
        }

        bool changed = false;
        try {
            changed = execute(p.command, p.session);
        } catch (const std::exception& e) {
            logError(kComponent, std::string("Command failed: ") + e.what());
        }
        if (p.done) p.done->set_value(changed);
    }

    if (session_) endSession();

    for (auto& s : parked_) {
        logInfo(kComponent, strCat("Waiting for segmentation worker of session ", s->id));
        s->worker->join(config_.joinTimeout);
    }
    parked_.clear();
}

bool Controller::execute(Command command, uint64_t session) {
    const State current = state();

    switch (command) {
        case Command::StartRecording: return enter(State::Recording);
        case Command::StopRecording: return leave(State::Recording);
        case Command::ToggleRecording:
            return current == State::Recording ? leave(State::Recording) : enter(State::Recording);
        case Command::StartListening: return enter(State::Listening);
        case Command::StopListening: return leave(State::Listening);
        case Command::ToggleListening:
            return current == State::Listening ? leave(State::Listening) : enter(State::Listening);
        case Command::Stop:
            if (current == State::Stopped) return false;
            endSession();
            return true;
        case Command::StreamEnded:
            // Late notification from a session that is already gone.
            if (!session_ || session_->id != session) return false;
            logError(kComponent, "Audio stream ended unexpectedly, stopping");
            endSession();
            return true;
    }
    return false;
}

bool Controller::enter(State mode) {
    const State current = state();
    if (current == mode) return false;
    if (current != State::Stopped) {
        logInfo(kComponent, std::string("Leaving ") + controllerStateName(current) + " first");
        endSession();
    }

    try {
        beginSession(mode);
    } catch (const std::exception& e) {
        logError(kComponent, std::string("Could not start ") + controllerStateName(mode) + ": " + e.what());
        session_.reset();
        return current != State::Stopped;
    }
    setState(mode);
    return true;
}

bool Controller::leave(State mode) {
    if (state() != mode) return false;
    endSession();
    return true;
}

void Controller::beginSession(State mode) {
    reapParked();

    auto s = std::make_unique<Session>();
    s->id = nextSession_++;
    s->mode = mode;
    s->capture = captureFactory_();
    if (!s->capture) throw std::runtime_error("no capture device available");
    s->channel = std::make_shared<FrameChannel>(config_.channelCapacity);

    SegmentationWorker::Config wc;
    wc.mode = mode == State::Recording ? SegmentationWorker::Mode::Manual : SegmentationWorker::Mode::Segment;
    wc.segmenter = config_.segmenter;
    wc.popTimeout = config_.popTimeout;

    std::unique_ptr<VoiceClassifier> classifier;
    if (mode == State::Listening) {
        classifier = std::make_unique<VoiceClassifier>(config_.classifier, detectorFactory_());
    }

    UtteranceSink* sink = &sink_;
    s->worker = std::make_unique<SegmentationWorker>(wc, s->channel, std::move(classifier),
                                                     [sink](Utterance&& u) { sink->submit(std::move(u)); });

    s->source = std::make_unique<FrameSource>(config_.source, *s->capture, s->channel);
    FrameSource* source = s->source.get();
    s->worker->setStatusCheck([source] { return source->takeStatusEvents(); });

    const uint64_t id = s->id;
    s->source->setDeviceLostCallback([this, id] { post(Command::StreamEnded, id, false); });

    sink_.setTargetWindow(injector_.activeWindow());

    s->worker->start();
    session_ = std::move(s);
    try {
        session_->source->start();
    } catch (...) {
        // Let the worker see end of stream before the session is torn down.
        session_->channel->pushEndOfStream();
        session_->worker->join(config_.joinTimeout);
        throw;
    }

    logInfo(kComponent, mode == State::Recording ? "Recording started" : "Listening mode started");
}

void Controller::endSession() {
    if (!session_) {
        setState(State::Stopped);
        return;
    }

    const State mode = session_->mode;

    // Device first, then the sentinel (inside FrameSource::stop), then the worker.
    session_->source->stop();
    session_->worker->requestStop();
    if (session_->worker->waitFinished(config_.joinTimeout)) {
        session_->worker->join(config_.joinTimeout);
        session_.reset();
    } else {
        // The worker still reads the source and channel; keep them until it returns.
        logError(kComponent, strCat("Segmentation worker did not stop within ", config_.joinTimeout.count(),
                                    " ms, parking session ", session_->id));
        parked_.push_back(std::move(session_));
    }
    reapParked();
    setState(State::Stopped);
    logInfo(kComponent, mode == State::Recording ? "Recording stopped" : "Listening mode stopped");
}

void Controller::reapParked() {
    for (auto it = parked_.begin(); it != parked_.end();) {
        if ((*it)->worker->waitFinished(std::chrono::milliseconds(0))) {
            (*it)->worker->join(config_.joinTimeout);
            logInfo(kComponent, strCat("Parked session ", (*it)->id, " finished"));
            it = parked_.erase(it);
        } else {
            ++it;
        }
    }
}

void Controller::setState(State next) {
    const State prev = static_cast<State>(state_.exchange(static_cast<int>(next)));
    if (prev == next) return;

    logDebug(kComponent, std::string("State ") + controllerStateName(prev) + " -> " + controllerStateName(next));

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners = listeners_;
    }
    for (const auto& l : listeners) {
        try {
            l(prev, next);
        } catch (const std::exception& e) {
            logError(kComponent, std::string("State listener threw: ") + e.what());
        }
    }
}
