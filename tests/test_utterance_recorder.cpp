/**
 * @file test_utterance_recorder.cpp
 * @brief Energy-based segmentation in UtteranceRecorder
 */

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "audio/utterance_recorder.hpp"

namespace {

constexpr int kRate = 16000;
constexpr int kBlock = 160;  // 10 ms
constexpr double kPi = 3.14159265358979323846;

std::vector<float> tone(int samples, float amplitude) {
    std::vector<float> out(samples);
    for (int i = 0; i < samples; ++i) out[i] = amplitude * (float)std::sin(2.0 * kPi * 440.0 * i / kRate);
    return out;
}

// Feeds in 10 ms blocks; returns true if any block completed the utterance.
bool feedBlocks(UtteranceRecorder& recorder, const std::vector<float>& pcm) {
    bool done = false;
    for (std::size_t i = 0; i + kBlock <= pcm.size(); i += kBlock) {
        done = recorder.feed(pcm.data() + i, kBlock) || done;
    }
    return done;
}

UtteranceRecorder::Config config() {
    UtteranceRecorder::Config c;
    c.sampleRate = kRate;
    return c;
}

} // namespace

TEST(UtteranceRecorder, SilenceNeverStartsListening) {
    UtteranceRecorder recorder(config());
    EXPECT_FALSE(feedBlocks(recorder, std::vector<float>(kRate, 0.0f)));
    EXPECT_FALSE(recorder.isListening());
    EXPECT_TRUE(recorder.utterance().empty());
}

TEST(UtteranceRecorder, SpeechThenSilenceCompletesUtterance) {
    UtteranceRecorder recorder(config());
    feedBlocks(recorder, std::vector<float>(kRate / 2, 0.0f));
    EXPECT_FALSE(feedBlocks(recorder, tone(kRate / 2, 0.3f)));
    EXPECT_TRUE(recorder.isListening());

    EXPECT_TRUE(feedBlocks(recorder, std::vector<float>(kRate, 0.0f)));
    EXPECT_TRUE(recorder.hasUtterance());
    EXPECT_FALSE(recorder.isListening());

    // Pre-roll (250 ms) + speech + the 550 ms of trailing silence that ended it.
    const std::size_t expected = (std::size_t)(kRate / 4 + kRate / 2 + kRate * 55 / 100) - kBlock * 8;
    EXPECT_GE(recorder.utterance().size(), expected);
    EXPECT_LE(recorder.utterance().size(), (std::size_t)(kRate / 4 + kRate / 2 + kRate * 56 / 100));
}

TEST(UtteranceRecorder, ShortClickIsIgnored) {
    UtteranceRecorder recorder(config());
    feedBlocks(recorder, tone(kBlock * 3, 0.5f));
    feedBlocks(recorder, std::vector<float>(kBlock * 10, 0.0f));
    EXPECT_FALSE(recorder.isListening());
}

TEST(UtteranceRecorder, LongSpeechIsCutAtMaximum) {
    UtteranceRecorder::Config c = config();
    c.maxUtteranceMs = 1000;
    UtteranceRecorder recorder(c);

    EXPECT_TRUE(feedBlocks(recorder, tone(kRate * 3, 0.3f)));
    EXPECT_TRUE(recorder.hasUtterance());
    EXPECT_LE(recorder.utterance().size(), (std::size_t)(kRate + kBlock));
}

TEST(UtteranceRecorder, AcceptsUnevenBlocks) {
    UtteranceRecorder recorder(config());
    const std::vector<float> speech = tone(1024 * 8, 0.3f);
    for (std::size_t i = 0; i < speech.size(); i += 1024) recorder.feed(speech.data() + i, 1024);
    EXPECT_TRUE(recorder.isListening());
}

TEST(UtteranceRecorder, ResetStartsOver) {
    UtteranceRecorder recorder(config());
    feedBlocks(recorder, tone(kRate / 2, 0.3f));
    feedBlocks(recorder, std::vector<float>(kRate, 0.0f));
    ASSERT_TRUE(recorder.hasUtterance());

    recorder.reset();
    EXPECT_FALSE(recorder.hasUtterance());
    EXPECT_FALSE(recorder.isListening());
    EXPECT_TRUE(recorder.utterance().empty());
}
