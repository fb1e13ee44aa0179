#include <cassert>
#include <chrono>
#include <cstdint>
#include <thread>
#include "audio/frame_channel.hpp"
#include "test_doubles.hpp"

using std::chrono::milliseconds;

static Frame tagged(int16_t tag) {
    Frame f;
    f.samples = {tag};
    return f;
}

static void fifo_order() {
    FrameChannel ch(4);
    assert(ch.push(tagged(1)));
    assert(ch.push(tagged(2)));
    assert(ch.size() == 2);

    Frame out;
    assert(ch.pop(out, milliseconds(10)) == FrameChannel::PopResult::Frame);
    assert(out.samples[0] == 1);
    assert(ch.pop(out, milliseconds(10)) == FrameChannel::PopResult::Frame);
    assert(out.samples[0] == 2);
}

static void overflow_drops_the_oldest() {
    FrameChannel ch(3);
    for (int16_t i = 1; i <= 5; ++i) assert(ch.push(tagged(i)));

    assert(ch.size() == 3);
    assert(ch.droppedTotal() == 2);
    assert(ch.takeDropped() == 2);
    assert(ch.takeDropped() == 0);

    Frame out;
    for (int16_t expect = 3; expect <= 5; ++expect) {
        assert(ch.pop(out, milliseconds(10)) == FrameChannel::PopResult::Frame);
        assert(out.samples[0] == expect);
    }
}

static void sentinel_follows_pending_frames() {
    FrameChannel ch(2);
    ch.push(tagged(7));
    ch.push(tagged(8));
    ch.pushEndOfStream();
    ch.pushEndOfStream();

    assert(ch.endOfStreamQueued());
    assert(!ch.push(tagged(9)));
    assert(ch.size() == 3);
    assert(ch.droppedTotal() == 0);

    Frame out;
    assert(ch.pop(out, milliseconds(10)) == FrameChannel::PopResult::Frame);
    assert(out.samples[0] == 7);
    assert(ch.pop(out, milliseconds(10)) == FrameChannel::PopResult::Frame);
    assert(out.samples[0] == 8);
    assert(ch.pop(out, milliseconds(10)) == FrameChannel::PopResult::EndOfStream);

    // Stays ended without waiting out the timeout.
    const auto t0 = std::chrono::steady_clock::now();
    assert(ch.pop(out, milliseconds(2000)) == FrameChannel::PopResult::EndOfStream);
    assert(std::chrono::steady_clock::now() - t0 < milliseconds(1000));
}

static void empty_pop_times_out() {
    FrameChannel ch(2);
    Frame out;
    assert(ch.pop(out, milliseconds(20)) == FrameChannel::PopResult::Timeout);
}

static void pop_wakes_on_push_from_another_thread() {
    FrameChannel ch(2);
    std::thread producer([&ch] {
        std::this_thread::sleep_for(milliseconds(30));
        ch.push(tagged(11));
        ch.pushEndOfStream();
    });

    Frame out;
    assert(ch.pop(out, milliseconds(2000)) == FrameChannel::PopResult::Frame);
    assert(out.samples[0] == 11);
    assert(ch.pop(out, milliseconds(2000)) == FrameChannel::PopResult::EndOfStream);
    producer.join();
}

static void zero_capacity_holds_one_frame() {
    FrameChannel ch(0);
    assert(ch.capacity() == 1);
    ch.push(tagged(1));
    ch.push(tagged(2));
    assert(ch.size() == 1);
    assert(ch.droppedTotal() == 1);
}

int main() {
    fifo_order();
    overflow_drops_the_oldest();
    sentinel_follows_pending_frames();
    empty_pop_times_out();
    pop_wakes_on_push_from_another_thread();
    zero_capacity_holds_one_frame();
    return 0;
}
