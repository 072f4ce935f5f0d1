/**
 * @file test_recognizer_error.cpp
 * @brief Fixed user-facing messages of RecognizerError
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "speech/recognizer_error.hpp"

TEST(RecognizerError, FixedMessagePerKind) {
    using Kind = RecognizerError::Kind;
    EXPECT_STREQ(RecognizerError(Kind::NilRecognizer).what(), "can't initialize speech recognizer");
    EXPECT_STREQ(RecognizerError(Kind::NotAuthorizedToRecognize).what(), "Not authorized to recognize speech");
    EXPECT_STREQ(RecognizerError(Kind::NotPermittedToRecord).what(), "Not permitted to record audio");
    EXPECT_STREQ(RecognizerError(Kind::RecognizerUnavailable).what(), "Recognizer is unavailable");
}

TEST(RecognizerError, FixedKindsIgnoreDescription) {
    RecognizerError e(RecognizerError::Kind::NotPermittedToRecord, "something else");
    EXPECT_EQ(describeError(e), "Not permitted to record audio");
}

TEST(RecognizerError, OtherPassesDescriptionThrough) {
    RecognizerError e(RecognizerError::Kind::Other, "The operation couldn't be completed");
    EXPECT_EQ(e.kind(), RecognizerError::Kind::Other);
    EXPECT_EQ(describeError(e), "The operation couldn't be completed");
    EXPECT_EQ(describeError(std::runtime_error("Pa_OpenStream (-9996): Invalid device")),
              "Pa_OpenStream (-9996): Invalid device");
}

TEST(RecognizerError, BracketedWrapsInMarkers) {
    EXPECT_EQ(bracketed("Recognizer is unavailable"), "<< Recognizer is unavailable >>");
}
