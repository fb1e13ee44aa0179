#include <cassert>
#include <chrono>
#include <cstdint>
#include <vector>
#include "audio/utterance_segmenter.hpp"
#include "test_doubles.hpp"

using Clock = UtteranceSegmenter::Clock;
using std::chrono::milliseconds;

static UtteranceSegmenter::Config config(int holdMs, bool gate = false) {
    UtteranceSegmenter::Config c;
    c.sampleRate = 16000;
    c.frameMs = 30;
    c.silenceHoldMs = holdMs;
    c.inactivityTimeoutMs = holdMs * 2;
    c.energyGate = gate;
    return c;
}

// Frame whose first sample carries its 1-based index, so order can be checked after emission.
static Frame numbered(int index) {
    Frame f = makeFrame(silenceSamples(480));
    f.samples[1] = (int16_t)index;
    return f;
}

// Feeds frames on a simulated 30 ms clock so the watchdog never fires.
struct Driver {
    UtteranceSegmenter seg;
    Clock::time_point now = Clock::now();

    explicit Driver(UtteranceSegmenter::Config c) : seg(c) {}

    bool feed(int index, bool speech, bool energyAbove = true) {
        now += milliseconds(30);
        const bool emitted = seg.feed(numbered(index), speech, energyAbove, now);
        seg.checkInactivity(now);
        return emitted;
    }
};

static void speech_then_full_hold_emits_everything_once() {
    // 1000 ms hold at 30 ms frames needs 34 silent frames.
    Driver d(config(1000));
    assert(d.seg.maxSilenceFrames() == 34);

    int index = 0;
    for (int i = 0; i < 7; ++i) assert(!d.feed(++index, true));
    for (int i = 0; i < 33; ++i) assert(!d.feed(++index, false));
    assert(d.seg.state() == UtteranceSegmenter::State::InSpeech);
    assert(d.feed(++index, false));

    assert(d.seg.state() == UtteranceSegmenter::State::Idle);
    assert(d.seg.bufferedFrames() == 0);
    assert(d.seg.hasUtterance());

    Utterance u = d.seg.takeUtterance();
    assert(u.frames.size() == 7 + 34);
    for (size_t i = 0; i < u.frames.size(); ++i) assert(u.frames[i].samples[1] == (int16_t)(i + 1));
    assert(!d.seg.hasUtterance());
}

static void alternating_frames_only_emit_at_end_of_stream() {
    Driver d(config(300));
    for (int i = 1; i <= 200; ++i) assert(!d.feed(i, i % 2 == 1));
    assert(!d.seg.hasUtterance());
    assert(d.seg.state() == UtteranceSegmenter::State::InSpeech);

    assert(d.seg.flush());
    assert(d.seg.hasUtterance());
    assert(d.seg.takeUtterance().frames.size() == 200);

    // Second flush has nothing to emit.
    assert(!d.seg.flush());
    assert(!d.seg.hasUtterance());
}

static void scenario_a_one_utterance_of_64_frames() {
    Driver d(config(990));

    int emittedAt = -1;
    size_t emissions = 0;
    for (int i = 1; i <= 100; ++i) {
        const bool speech = i >= 10 && i <= 40;
        if (d.feed(i, speech)) {
            ++emissions;
            emittedAt = i;
            assert(d.seg.state() == UtteranceSegmenter::State::Idle);
        }
        if (i == 74) assert(d.seg.state() == UtteranceSegmenter::State::Idle);
    }

    assert(emissions == 1);
    assert(emittedAt == 73);

    Utterance u = d.seg.takeUtterance();
    assert(u.frames.size() == 64);
    assert(u.frames.front().samples[1] == 10);
    assert(u.frames.back().samples[1] == 73);
    assert(!d.seg.hasUtterance());
}

static void scenario_b_partial_utterance_flushed_at_end_of_stream() {
    Driver d(config(1000));
    for (int i = 1; i <= 3; ++i) d.feed(i, false);
    for (int i = 4; i <= 8; ++i) d.feed(i, true);
    assert(d.seg.bufferedFrames() == 5);

    assert(d.seg.flush());
    Utterance u = d.seg.takeUtterance();
    assert(u.frames.size() == 5);
    assert(u.sampleRate == 16000);
    assert(d.seg.state() == UtteranceSegmenter::State::Idle);
}

static void scenario_c_energy_gate_blocks_activation() {
    Driver d(config(1000, true));
    for (int i = 1; i <= 50; ++i) assert(!d.feed(i, true, false));
    assert(d.seg.state() == UtteranceSegmenter::State::Idle);
    assert(d.seg.bufferedFrames() == 0);
    assert(!d.seg.flush());

    // Once active, low energy no longer matters.
    d.feed(51, true, true);
    assert(d.seg.state() == UtteranceSegmenter::State::InSpeech);
    d.feed(52, true, false);
    assert(d.seg.bufferedFrames() == 2);
}

static void gate_off_ignores_energy() {
    Driver d(config(1000, false));
    d.feed(1, true, false);
    assert(d.seg.state() == UtteranceSegmenter::State::InSpeech);
}

static void watchdog_emits_after_inactivity() {
    UtteranceSegmenter seg(config(1000));
    const Clock::time_point t0 = Clock::now();

    assert(!seg.feed(numbered(1), true, true, t0));
    assert(!seg.feed(numbered(2), false, false, t0 + milliseconds(30)));

    assert(!seg.checkInactivity(t0 + milliseconds(2000)));
    assert(seg.state() == UtteranceSegmenter::State::InSpeech);

    assert(seg.checkInactivity(t0 + milliseconds(2001)));
    assert(seg.state() == UtteranceSegmenter::State::Idle);
    assert(seg.takeUtterance().frames.size() == 2);

    // Idle: nothing to force.
    assert(!seg.checkInactivity(t0 + milliseconds(10000)));
    assert(!seg.hasUtterance());
}

static void silence_while_idle_is_discarded() {
    Driver d(config(30));
    for (int i = 1; i <= 20; ++i) assert(!d.feed(i, false));
    assert(!d.seg.hasUtterance());
    assert(d.seg.bufferedFrames() == 0);
    assert(!d.seg.flush());
}

static void each_utterance_gets_its_own_buffer() {
    Driver d(config(60));
    d.feed(1, true);
    d.feed(2, false);
    assert(d.feed(3, false));
    d.feed(4, true);
    d.feed(5, false);
    assert(d.feed(6, false));

    Utterance first = d.seg.takeUtterance();
    Utterance second = d.seg.takeUtterance();
    assert(first.frames.size() == 3);
    assert(second.frames.size() == 3);
    assert(first.frames[0].samples[1] == 1);
    assert(second.frames[0].samples[1] == 4);
}

static void speech_resets_the_silence_counter() {
    Driver d(config(90));
    assert(d.seg.maxSilenceFrames() == 3);
    d.feed(1, true);
    d.feed(2, false);
    d.feed(3, false);
    assert(d.seg.silenceFrames() == 2);
    d.feed(4, true);
    assert(d.seg.silenceFrames() == 0);
    d.feed(5, false);
    d.feed(6, false);
    assert(!d.seg.hasUtterance());
    assert(d.feed(7, false));
    assert(d.seg.takeUtterance().frames.size() == 7);
}

int main() {
    speech_then_full_hold_emits_everything_once();
    alternating_frames_only_emit_at_end_of_stream();
    scenario_a_one_utterance_of_64_frames();
    scenario_b_partial_utterance_flushed_at_end_of_stream();
    scenario_c_energy_gate_blocks_activation();
    gate_off_ignores_energy();
    watchdog_emits_after_inactivity();
    silence_while_idle_is_discarded();
    each_utterance_gets_its_own_buffer();
    speech_resets_the_silence_counter();
    return 0;
}
