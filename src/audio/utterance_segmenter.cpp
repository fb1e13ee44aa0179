#include "audio/utterance_segmenter.hpp"

#include <algorithm>
#include <utility>

const char* segmenterStateName(UtteranceSegmenter::State state) {
    return state == UtteranceSegmenter::State::InSpeech ? "InSpeech" : "Idle";
}

// Constructor
UtteranceSegmenter::UtteranceSegmenter(Config config) : config_(config) {
    const int frameMs = std::max(1, config_.frameMs);
    // Smallest silence run with count * frameMs >= hold.
    maxSilenceFrames_ = std::max(1, (config_.silenceHoldMs + frameMs - 1) / frameMs);
}

// Drops any buffered frames and returns to Idle. Completed utterances are kept.
void UtteranceSegmenter::reset() {
    state_ = State::Idle;
    buffer_ = std::vector<Frame>();
    silenceFrames_ = 0;
}

bool UtteranceSegmenter::emit() {
    if (buffer_.empty()) {
        reset();
        return false;
    }

    Utterance u;
    u.sampleRate = config_.sampleRate;
    u.frames = std::move(buffer_);
    ready_.push_back(std::move(u));

    reset();
    return true;
}

bool UtteranceSegmenter::feed(Frame frame, bool isSpeech, bool energyAbove, Clock::time_point now) {
    if (state_ == State::Idle) {
        if (!isSpeech) return false;
        if (config_.energyGate && !energyAbove) return false;

        state_ = State::InSpeech;
        buffer_ = std::vector<Frame>();
        buffer_.push_back(std::move(frame));
        silenceFrames_ = 0;
        lastSpeech_ = now;
        return false;
    }

    buffer_.push_back(std::move(frame));

    if (isSpeech) {
        silenceFrames_ = 0;
        lastSpeech_ = now;
        return false;
    }

    ++silenceFrames_;
    if (silenceFrames_ * config_.frameMs >= config_.silenceHoldMs) return emit();
    return false;
}

bool UtteranceSegmenter::checkInactivity(Clock::time_point now) {
    if (state_ != State::InSpeech) return false;

    const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastSpeech_);
    if (idle.count() <= config_.inactivityTimeoutMs) return false;
    return emit();
}

bool UtteranceSegmenter::flush() {
    if (state_ != State::InSpeech) return false;
    return emit();
}

Utterance UtteranceSegmenter::takeUtterance() {
    if (ready_.empty()) return Utterance{};

    Utterance u = std::move(ready_.front());
    ready_.pop_front();
    return u;
}
