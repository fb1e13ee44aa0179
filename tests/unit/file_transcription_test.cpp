#include <cassert>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "app/file_transcription.hpp"
#include "audio/wav.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "test_doubles.hpp"

static const std::string kWavPath = "./file_transcription_test.wav";
static const std::string kTranscriptPath = "./file_transcription_test.txt";

static void mono_file_is_sent_unchanged() {
    std::vector<int16_t> pcm(1600, 0);
    pcm[0] = 1234;
    pcm[1599] = -77;
    writeFileBytes(kWavPath, encodeWav(pcm, 16000));

    FakeTranscriber stt({"  hello from a file \n"});
    assert(transcribeWavFile(kWavPath, stt) == "hello from a file");
    assert(stt.callCount() == 1);

    WavData sent = decodeWav(stt.lastWav);
    assert(sent.channels == 1);
    assert(sent.sampleRate == 16000);
    assert(sent.samples == pcm);
    std::remove(kWavPath.c_str());
}

static void stereo_file_is_averaged_to_mono() {
    // Interleaved L/R pairs, then the header is patched to two channels.
    const std::vector<int16_t> interleaved = {1000, 3000, -2000, -4000, 10, 20};
    std::vector<uint8_t> bytes = encodeWav(interleaved, 16000);
    bytes[22] = 2;
    writeFileBytes(kWavPath, bytes);

    FakeTranscriber stt({"stereo"});
    assert(transcribeWavFile(kWavPath, stt) == "stereo");

    WavData sent = decodeWav(stt.lastWav);
    assert(sent.channels == 1);
    assert((sent.samples == std::vector<int16_t>{2000, -3000, 15}));
    std::remove(kWavPath.c_str());
}

static void other_rates_are_resampled() {
    std::vector<int16_t> pcm(32000, 500);
    writeFileBytes(kWavPath, encodeWav(pcm, 32000));

    FakeTranscriber stt({"resampled"});
    assert(transcribeWavFile(kWavPath, stt) == "resampled");

    WavData sent = decodeWav(stt.lastWav);
    assert(sent.sampleRate == 16000);
    assert(sent.samples.size() == 16000);
    assert(sent.samples[0] == 500 && sent.samples[15999] == 500);
    std::remove(kWavPath.c_str());
}

static void resampling_interpolates_between_samples() {
    const std::vector<int16_t> up = resampleLinear({0, 100}, 8000, 16000);
    assert((up == std::vector<int16_t>{0, 50, 100, 100}));

    const std::vector<int16_t> same = resampleLinear({1, 2, 3}, 16000, 16000);
    assert((same == std::vector<int16_t>{1, 2, 3}));
}

static void unreadable_inputs_throw() {
    FakeTranscriber stt({});

    bool threw = false;
    try {
        transcribeWavFile("./no_such_file.wav", stt);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("cannot open") != std::string::npos;
    }
    assert(threw);

    std::ofstream(kWavPath) << "not a wav file";
    threw = false;
    try {
        transcribeWavFile(kWavPath, stt);
    } catch (const WavFormatError&) {
        threw = true;
    }
    assert(threw);
    assert(stt.callCount() == 0);
    std::remove(kWavPath.c_str());
}

static void transcriber_errors_propagate() {
    writeFileBytes(kWavPath, encodeWav(std::vector<int16_t>(160, 0), 16000));
    FakeTranscriber stt({"!fail"});

    bool threw = false;
    try {
        transcribeWavFile(kWavPath, stt);
    } catch (const TranscriptionError&) {
        threw = true;
    }
    assert(threw);
    std::remove(kWavPath.c_str());
}

static void transcript_lines_are_appended() {
    std::remove(kTranscriptPath.c_str());
    assert(appendTranscriptLine(kTranscriptPath, "first"));
    assert(appendTranscriptLine(kTranscriptPath, "second"));

    std::ifstream in(kTranscriptPath);
    std::string a, b, c;
    assert(std::getline(in, a) && a == "first");
    assert(std::getline(in, b) && b == "second");
    assert(!std::getline(in, c));
    std::remove(kTranscriptPath.c_str());

    assert(!appendTranscriptLine("./no_such_dir/transcript.txt", "lost"));
}

int main() {
    setLogLevel(LogLevel::Error);
    mono_file_is_sent_unchanged();
    stereo_file_is_averaged_to_mono();
    other_rates_are_resampled();
    resampling_interpolates_between_samples();
    unreadable_inputs_throw();
    transcriber_errors_propagate();
    transcript_lines_are_appended();
    return 0;
}
