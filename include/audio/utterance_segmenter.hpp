#ifndef UTTERANCE_SEGMENTER_HPP
#define UTTERANCE_SEGMENTER_HPP

#include "audio/frame.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <vector>

// Idle / InSpeech state machine over classified frames.
//
// Speech opens an utterance (optionally only when the frame energy clears the
// bootstrap gate). Every later frame is kept, including trailing silence, and
// the utterance is emitted once the silence hold is reached. A wall-clock
// watchdog emits as well when no speech frame has been seen for the
// inactivity timeout. Each emitted utterance gets a fresh frame buffer.
class UtteranceSegmenter {
public:
    using Clock = std::chrono::steady_clock;

    enum class State { Idle, InSpeech };

    struct Config {
        int sampleRate = 16000;
        int frameMs = 30;

        int silenceHoldMs = 1000;
        int inactivityTimeoutMs = 2000;

        // Require energy above threshold for the Idle -> InSpeech transition.
        bool energyGate = false;
    };

    explicit UtteranceSegmenter(Config config);

    // Returns true when this frame completed an utterance.
    bool feed(Frame frame, bool isSpeech, bool energyAbove, Clock::time_point now);

    // Returns true when the watchdog forced an emission.
    bool checkInactivity(Clock::time_point now);

    // End of stream: emits the partial utterance, if any.
    bool flush();

    bool hasUtterance() const { return !ready_.empty(); }
    Utterance takeUtterance();

    State state() const { return state_; }
    size_t bufferedFrames() const { return buffer_.size(); }
    int silenceFrames() const { return silenceFrames_; }
    int maxSilenceFrames() const { return maxSilenceFrames_; }

    void reset();

private:
    bool emit();

    Config config_;
    int maxSilenceFrames_ = 1;

    State state_ = State::Idle;
    std::vector<Frame> buffer_;
    int silenceFrames_ = 0;
    Clock::time_point lastSpeech_{};

    std::deque<Utterance> ready_;
};

const char* segmenterStateName(UtteranceSegmenter::State state);

#endif
