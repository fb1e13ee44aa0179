#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "audio/segmentation_worker.hpp"
#include "core/log.hpp"
#include "test_doubles.hpp"

using std::chrono::milliseconds;

static const size_t kFrame = 480;

struct Collected {
    std::mutex mutex;
    std::vector<Utterance> utterances;

    SegmentationWorker::UtteranceCallback callback() {
        return [this](Utterance&& u) {
            std::lock_guard<std::mutex> lock(mutex);
            utterances.push_back(std::move(u));
        };
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return utterances.size();
    }
};

static SegmentationWorker::Config workerConfig(SegmentationWorker::Mode mode, int holdMs) {
    SegmentationWorker::Config c;
    c.mode = mode;
    c.segmenter.sampleRate = 16000;
    c.segmenter.frameMs = 30;
    c.segmenter.silenceHoldMs = holdMs;
    c.segmenter.inactivityTimeoutMs = 60000;
    c.popTimeout = milliseconds(20);
    return c;
}

static std::unique_ptr<VoiceClassifier> classifier() {
    VoiceClassifier::Config c;
    c.sampleRate = 16000;
    c.frameMs = 30;
    return std::make_unique<VoiceClassifier>(c, std::make_unique<MarkerDetector>());
}

static void segments_and_flushes_at_end_of_stream() {
    auto channel = std::make_shared<FrameChannel>(64);
    Collected out;
    SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Segment, 90), channel, classifier(),
                              out.callback());

    for (int i = 0; i < 3; ++i) channel->push(makeFrame(speechSamples(kFrame)));
    for (int i = 0; i < 3; ++i) channel->push(makeFrame(silenceSamples(kFrame)));
    for (int i = 0; i < 2; ++i) channel->push(makeFrame(speechSamples(kFrame)));
    channel->pushEndOfStream();

    worker.run();

    assert(out.count() == 2);
    assert(out.utterances[0].frames.size() == 6);
    assert(out.utterances[1].frames.size() == 2);
    assert(worker.framesProcessed() == 8);
    assert(worker.utterancesEmitted() == 2);
}

static void mis_sized_frames_are_normalized_before_classification() {
    auto channel = std::make_shared<FrameChannel>(16);
    Collected out;
    SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Segment, 1000), channel, classifier(),
                              out.callback());

    channel->push(makeFrame(speechSamples(100)));
    channel->push(makeFrame(speechSamples(kFrame + 37)));
    channel->pushEndOfStream();
    worker.run();

    assert(worker.framesSkipped() == 0);
    assert(out.count() == 1);
    for (const Frame& f : out.utterances[0].frames) assert(f.samples.size() == kFrame);
}

static void manual_mode_keeps_every_frame() {
    auto channel = std::make_shared<FrameChannel>(16);
    Collected out;
    SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Manual, 30), channel, nullptr, out.callback());

    channel->push(makeFrame(silenceSamples(kFrame)));
    channel->push(makeFrame(speechSamples(kFrame)));
    channel->push(makeFrame(silenceSamples(kFrame)));
    channel->push(makeFrame(silenceSamples(kFrame)));
    channel->pushEndOfStream();
    worker.run();

    assert(out.count() == 1);
    assert(out.utterances[0].frames.size() == 4);
    assert(out.utterances[0].sampleRate == 16000);
}

static void manual_mode_with_no_audio_emits_nothing() {
    auto channel = std::make_shared<FrameChannel>(4);
    Collected out;
    SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Manual, 30), channel, nullptr, out.callback());
    channel->pushEndOfStream();
    worker.run();
    assert(out.count() == 0);
}

static void stop_request_drains_and_flushes() {
    auto channel = std::make_shared<FrameChannel>(16);
    Collected out;
    SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Segment, 1000), channel, classifier(),
                              out.callback());
    worker.start();

    channel->push(makeFrame(speechSamples(kFrame)));
    channel->push(makeFrame(speechSamples(kFrame)));
    assert(waitFor([&] { return worker.framesProcessed() == 2; }));

    worker.requestStop();
    assert(worker.waitFinished(milliseconds(2000)));
    worker.join(milliseconds(500));
    assert(worker.finished());
    assert(out.count() == 1);
    assert(out.utterances[0].frames.size() == 2);
}

static void inactivity_closes_utterance_without_new_frames() {
    auto channel = std::make_shared<FrameChannel>(16);
    Collected out;
    SegmentationWorker::Config cfg = workerConfig(SegmentationWorker::Mode::Segment, 1000);
    cfg.segmenter.inactivityTimeoutMs = 100;
    SegmentationWorker worker(cfg, channel, classifier(), out.callback());
    worker.start();

    channel->push(makeFrame(speechSamples(kFrame)));
    channel->push(makeFrame(speechSamples(kFrame)));

    // No silence and no end of stream: only the pop timeout wakes the loop.
    assert(waitFor([&] { return out.count() == 1; }));
    std::this_thread::sleep_for(milliseconds(200));
    assert(out.count() == 1);
    assert(out.utterances[0].frames.size() == 2);

    worker.requestStop();
    assert(worker.waitFinished(milliseconds(2000)));
    worker.join(milliseconds(500));
    assert(out.count() == 1);
}

// Fails on frames whose first sample is kBadMarker.
class FlakyDetector : public SpeechDetector {
public:
    static const int16_t kBadMarker = 7777;

    bool isSpeech(const int16_t* samples, size_t count) override {
        if (count > 0 && samples[0] == kBadMarker) throw std::runtime_error("detector rejected frame");
        return count > 0 && samples[0] != 0;
    }
};

static void classifier_failure_skips_one_frame() {
    auto channel = std::make_shared<FrameChannel>(16);
    Collected out;
    VoiceClassifier::Config vc;
    vc.sampleRate = 16000;
    vc.frameMs = 30;
    SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Segment, 30), channel,
                              std::make_unique<VoiceClassifier>(vc, std::make_unique<FlakyDetector>()), out.callback());

    channel->push(makeFrame(speechSamples(kFrame)));
    channel->push(makeFrame(speechSamples(kFrame, FlakyDetector::kBadMarker)));
    channel->push(makeFrame(speechSamples(kFrame)));
    channel->push(makeFrame(silenceSamples(kFrame)));
    channel->pushEndOfStream();
    worker.run();

    assert(worker.framesProcessed() == 4);
    assert(worker.framesSkipped() == 1);
    assert(out.count() == 1);
    assert(out.utterances[0].frames.size() == 3);
}

static void throwing_handler_does_not_stop_the_loop() {
    auto channel = std::make_shared<FrameChannel>(64);
    int calls = 0;
    SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Segment, 30), channel, classifier(),
                              [&calls](Utterance&&) {
                                  ++calls;
                                  throw std::runtime_error("sink rejected utterance");
                              });

    channel->push(makeFrame(speechSamples(kFrame)));
    channel->push(makeFrame(silenceSamples(kFrame)));
    channel->push(makeFrame(speechSamples(kFrame)));
    channel->push(makeFrame(silenceSamples(kFrame)));
    channel->pushEndOfStream();
    worker.run();

    assert(calls == 2);
    assert(worker.framesProcessed() == 4);
}

static void segment_mode_requires_a_classifier() {
    auto channel = std::make_shared<FrameChannel>(4);
    bool threw = false;
    try {
        SegmentationWorker worker(workerConfig(SegmentationWorker::Mode::Segment, 30), channel, nullptr, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    setLogLevel(LogLevel::Error);
    segments_and_flushes_at_end_of_stream();
    mis_sized_frames_are_normalized_before_classification();
    manual_mode_keeps_every_frame();
    manual_mode_with_no_audio_emits_nothing();
    stop_request_drains_and_flushes();
    inactivity_closes_utterance_without_new_frames();
    classifier_failure_skips_one_frame();
    throwing_handler_does_not_stop_the_loop();
    segment_mode_requires_a_classifier();
    return 0;
}
