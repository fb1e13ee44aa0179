#include "audio/segmentation_worker.hpp"
#include "core/log.hpp"

#include <atomic>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

static const char* kComponent = "Segmenter";

struct SegmentationWorker::Impl {
    Config config;
    std::shared_ptr<FrameChannel> channel;
    std::unique_ptr<VoiceClassifier> classifier;
    UtteranceCallback onUtterance;
    StatusCheck statusCheck;

    UtteranceSegmenter segmenter;
    FrameFormat format;
    std::vector<Frame> manualFrames;

    std::atomic<bool> stopRequested{false};
    std::atomic<size_t> framesProcessed{0};
    std::atomic<size_t> framesSkipped{0};
    std::atomic<size_t> utterancesEmitted{0};

    Impl(Config c, std::shared_ptr<FrameChannel> ch, std::unique_ptr<VoiceClassifier> cl, UtteranceCallback cb)
        : config(c), channel(std::move(ch)), classifier(std::move(cl)), onUtterance(std::move(cb)),
          segmenter(c.segmenter) {
        format.sampleRate = config.segmenter.sampleRate;
        format.frameMs = config.segmenter.frameMs;
    }

    void run();
    void handleFrame(Frame&& frame);
    void reportHealth();
    void deliverReady();
    void deliver(Utterance&& u);
    void finish();
};

void SegmentationWorker::Impl::run() {
    logInfo(kComponent, config.mode == Mode::Manual ? "Recording worker started" : "Listening worker started");

    for (;;) {
        const bool stopping = stopRequested.load();

        Frame frame;
        // Once stopping, only drain what is already queued.
        const auto wait = stopping ? std::chrono::milliseconds(0) : config.popTimeout;
        const FrameChannel::PopResult r = channel->pop(frame, wait);

        if (r == FrameChannel::PopResult::EndOfStream) break;

        if (r == FrameChannel::PopResult::Timeout) {
            if (stopping) break;
        } else {
            handleFrame(std::move(frame));
        }

        if (config.mode == Mode::Segment && segmenter.checkInactivity(UtteranceSegmenter::Clock::now())) {
            logInfo(kComponent, "Inactivity timeout, closing utterance");
            deliverReady();
        }
        reportHealth();
    }

    finish();
}

void SegmentationWorker::Impl::handleFrame(Frame&& frame) {
    if (normalizeFrameLength(frame.samples, format.samplesPerFrame())) {
        logDebug(kComponent, "Frame length corrected before classification");
    }
    framesProcessed.fetch_add(1);

    if (config.mode == Mode::Manual) {
        manualFrames.push_back(std::move(frame));
        return;
    }

    VoiceClassifier::Verdict v;
    try {
        v = classifier->classify(frame);
    } catch (const std::exception& e) {
        framesSkipped.fetch_add(1);
        logWarn(kComponent, std::string("Skipping frame: ") + e.what());
        return;
    }

    const bool wasIdle = segmenter.state() == UtteranceSegmenter::State::Idle;
    const bool done = segmenter.feed(std::move(frame), v.speech, v.energyAbove, UtteranceSegmenter::Clock::now());

    if (wasIdle && segmenter.state() == UtteranceSegmenter::State::InSpeech) {
        logDebug(kComponent, strCat("Speech started (energy ", v.energy, ")"));
    } else if (wasIdle && v.speech) {
        logDebug(kComponent, strCat("Speech frame below energy gate (energy ", v.energy, ")"));
    }

    if (done) deliverReady();
}

void SegmentationWorker::Impl::reportHealth() {
    const size_t dropped = channel->takeDropped();
    if (dropped > 0) {
        logWarn(kComponent, strCat("Frame channel full, dropped ", dropped, " oldest frame(s) (total ",
                                   channel->droppedTotal(), ")"));
    }

    if (statusCheck) {
        const size_t events = statusCheck();
        if (events > 0) logWarn(kComponent, strCat("Capture reported ", events, " input over/underflow(s)"));
    }
}

void SegmentationWorker::Impl::deliverReady() {
    while (segmenter.hasUtterance()) deliver(segmenter.takeUtterance());
}

void SegmentationWorker::Impl::deliver(Utterance&& u) {
    if (u.empty()) return;

    utterancesEmitted.fetch_add(1);
    logInfo(kComponent, strCat("Utterance complete: ", u.frames.size(), " frames, ", u.durationMs(), " ms"));

    if (!onUtterance) return;
    try {
        onUtterance(std::move(u));
    } catch (const std::exception& e) {
        logError(kComponent, std::string("Utterance handler failed: ") + e.what());
    }
}

void SegmentationWorker::Impl::finish() {
    if (config.mode == Mode::Manual) {
        if (!manualFrames.empty()) {
            Utterance u;
            u.sampleRate = format.sampleRate;
            u.frames = std::move(manualFrames);
            manualFrames = std::vector<Frame>();
            deliver(std::move(u));
        }
    } else if (segmenter.flush()) {
        logInfo(kComponent, "Stream ended mid-utterance, emitting partial utterance");
        deliverReady();
    }

    reportHealth();
    logInfo(kComponent, strCat("Worker finished: ", framesProcessed.load(), " frames, ", utterancesEmitted.load(),
                               " utterance(s), ", framesSkipped.load(), " skipped"));
}

// Constructor
SegmentationWorker::SegmentationWorker(Config config, std::shared_ptr<FrameChannel> channel,
                                       std::unique_ptr<VoiceClassifier> classifier, UtteranceCallback onUtterance)
    : impl_(std::make_shared<Impl>(config, std::move(channel), std::move(classifier), std::move(onUtterance))) {
    if (config.mode == Mode::Segment && !impl_->classifier) {
        throw std::invalid_argument("Segment mode needs a VoiceClassifier");
    }
}

// Destructor
SegmentationWorker::~SegmentationWorker() {
    requestStop();
}

void SegmentationWorker::setStatusCheck(StatusCheck check) { impl_->statusCheck = std::move(check); }

void SegmentationWorker::start() {
    std::shared_ptr<Impl> impl = impl_;
    thread_.start(kComponent, [impl] { impl->run(); });
}

void SegmentationWorker::requestStop() { impl_->stopRequested = true; }

bool SegmentationWorker::waitFinished(std::chrono::milliseconds timeout) { return thread_.wait(timeout); }

void SegmentationWorker::join(std::chrono::milliseconds progressInterval) { thread_.join(progressInterval); }

bool SegmentationWorker::finished() const { return thread_.done(); }

void SegmentationWorker::run() { impl_->run(); }

size_t SegmentationWorker::framesProcessed() const { return impl_->framesProcessed.load(); }
size_t SegmentationWorker::framesSkipped() const { return impl_->framesSkipped.load(); }
size_t SegmentationWorker::utterancesEmitted() const { return impl_->utterancesEmitted.load(); }
