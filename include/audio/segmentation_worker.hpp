#ifndef SEGMENTATION_WORKER_HPP
#define SEGMENTATION_WORKER_HPP

#include "audio/frame_channel.hpp"
#include "audio/utterance_segmenter.hpp"
#include "audio/voice_classifier.hpp"
#include "core/worker_thread.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

// Drains a FrameChannel on its own thread in strict arrival order.
//
// Segment mode classifies each frame and runs the UtteranceSegmenter.
// Manual mode ignores VAD and emits everything captured as one utterance
// when the stream ends.
class SegmentationWorker {
public:
    enum class Mode { Segment, Manual };

    using UtteranceCallback = std::function<void(Utterance&&)>;
    using StatusCheck = std::function<size_t()>;

    struct Config {
        Mode mode = Mode::Segment;
        UtteranceSegmenter::Config segmenter;

        // Wait per pop; only used to re-check the stop flag and the watchdog.
        std::chrono::milliseconds popTimeout{500};
    };

    // `classifier` may be null in Manual mode.
    SegmentationWorker(Config config, std::shared_ptr<FrameChannel> channel,
                       std::unique_ptr<VoiceClassifier> classifier, UtteranceCallback onUtterance);
    ~SegmentationWorker();

    SegmentationWorker(const SegmentationWorker&) = delete;
    SegmentationWorker& operator=(const SegmentationWorker&) = delete;

    // Reports capture under/overflows; polled from the worker thread.
    void setStatusCheck(StatusCheck check);

    void start();
    void requestStop();

    // True once the loop has returned; never gives up on the thread.
    bool waitFinished(std::chrono::milliseconds timeout);
    // Blocks until the loop returns, logging every `progressInterval`.
    void join(std::chrono::milliseconds progressInterval);
    bool finished() const;

    // Runs the loop on the calling thread until end of stream or stop.
    void run();

    size_t framesProcessed() const;
    size_t framesSkipped() const;
    size_t utterancesEmitted() const;

private:
    struct Impl;

    std::shared_ptr<Impl> impl_;
    WorkerThread thread_;
};

#endif
