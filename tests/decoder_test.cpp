/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "scriba/decoder.hpp"

using namespace scriba;

namespace {

template <class T>
const T& as(const StatusEvent& event) {
    EXPECT_TRUE(std::holds_alternative<T>(event)) << "variant index " << event.index();
    return std::get<T>(event);
}

TEST(DecodeLineTest, AudioDurationInfo) {
    auto event = decodeLine(R"({"status":"info","code":"audio_duration","message":"12.50"})");
    ASSERT_TRUE(std::holds_alternative<DurationInfo>(event));
    EXPECT_DOUBLE_EQ(std::get<DurationInfo>(event).seconds, 12.5);

    auto verbose = decodeLine(R"({"status":"info","code":"audio_duration","message":"Audio duration: 2785.08s"})");
    ASSERT_TRUE(std::holds_alternative<DurationInfo>(verbose));
    EXPECT_DOUBLE_EQ(std::get<DurationInfo>(verbose).seconds, 2785.08);
}

TEST(DecodeLineTest, OtherInfoIsDevice) {
    auto event = decodeLine(R"json({"status":"info","code":"cuda_available","message":"true (RTX 4090)"})json");
    ASSERT_TRUE(std::holds_alternative<DeviceInfo>(event));
    EXPECT_EQ(std::get<DeviceInfo>(event).code, "cuda_available");
    EXPECT_EQ(std::get<DeviceInfo>(event).message, "true (RTX 4090)");
}

TEST(DecodeLineTest, PhaseStatuses) {
    struct Case { const char* line; Phase phase; };
    const Case cases[] = {
        {R"({"status":"loading","message":"Loading model: tiny"})", Phase::ModelLoading},
        {R"({"status":"downloading"})", Phase::ModelDownloading},
        {R"({"status":"loading_complete"})", Phase::ModelLoaded},
        {R"({"status":"started"})", Phase::Transcribing},
        {R"({"status":"transcribing"})", Phase::Transcribing},
        {R"({"status":"completed","message":"done"})", Phase::Finished},
    };
    for (const auto& c : cases) {
        auto event = decodeLine(c.line);
        ASSERT_TRUE(std::holds_alternative<PhaseChange>(event)) << c.line;
        EXPECT_EQ(std::get<PhaseChange>(event).phase, c.phase) << c.line;
    }
}

TEST(DecodeLineTest, ProgressErrorCanceled) {
    auto progress = decodeLine(R"({"status":"progress","progress":37.5})");
    EXPECT_DOUBLE_EQ(as<ProgressReport>(progress).percent, 37.5);

    auto error = decodeLine(R"({"status":"error","code":"cuda_error","message":"out of memory"})");
    EXPECT_EQ(as<ErrorReport>(error).code, "cuda_error");
    EXPECT_EQ(as<ErrorReport>(error).message, "out of memory");

    auto canceled = decodeLine(R"({"status":"canceled","message":"Received signal 15"})");
    EXPECT_EQ(as<CanceledReport>(canceled).message, "Received signal 15");
}

TEST(DecodeLineTest, TimestampLines) {
    auto short_form = decodeLine("[00:00.000 --> 00:06.250]  Hello there.");
    EXPECT_DOUBLE_EQ(as<TimestampProgress>(short_form).seconds, 6.25);

    auto long_form = decodeLine("[01:00:01.000 --> 01:02:03.500] later");
    EXPECT_DOUBLE_EQ(as<TimestampProgress>(long_form).seconds, 3723.5);
}

TEST(DecodeLineTest, UnrecognizedLines) {
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decodeLine("Detecting language using up to 30 seconds")));
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decodeLine(R"({"status":"weird"})")));
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decodeLine(R"({"no_status":1})")));
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decodeLine("{ not json")));
    EXPECT_TRUE(std::holds_alternative<Unrecognized>(decodeLine("[00:00 --> 00:01]")));
}

TEST(DecodeLineTest, InvalidUtf8Dropped) {
    std::string line = "[00:00.000 --> 00:02.000] caf\xC3\xA9 \xFF\xFE ok";
    EXPECT_DOUBLE_EQ(as<TimestampProgress>(decodeLine(line)).seconds, 2.0);

    auto junk = decodeLine("abc\xFF" "def");
    EXPECT_EQ(as<Unrecognized>(junk).line, "abcdef");
}

TEST(TimestampTest, ParseAndFormat) {
    EXPECT_DOUBLE_EQ(parseTimestamp("00:12.500").value_or(-1), 12.5);
    EXPECT_DOUBLE_EQ(parseTimestamp("1:02:03.250").value_or(-1), 3723.25);
    EXPECT_FALSE(parseTimestamp("garbage").has_value());
    EXPECT_FALSE(parseTimestamp("12.5").has_value());

    EXPECT_EQ(formatTimestamp(6.25), "00:06.250");
    EXPECT_EQ(formatTimestamp(125.0), "02:05.000");
    EXPECT_EQ(formatTimestamp(3723.5), "01:02:03.500");
}

TEST(StatusStreamDecoderTest, BuffersPartialLines) {
    StatusStreamDecoder decoder;
    auto events = decoder.feed(R"({"status":"load)");
    EXPECT_TRUE(events.empty());
    EXPECT_GT(decoder.pendingBytes(), 0u);

    events = decoder.feed("ing\"}\n[00:00.000 --> 00:01.000] hi\n");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<PhaseChange>(events[0]));
    EXPECT_TRUE(std::holds_alternative<TimestampProgress>(events[1]));
    EXPECT_EQ(decoder.pendingBytes(), 0u);
    EXPECT_EQ(decoder.linesDecoded(), 2u);
}

TEST(StatusStreamDecoderTest, FinishFlushesTrailingLine) {
    StatusStreamDecoder decoder;
    EXPECT_TRUE(decoder.feed(R"({"status":"completed"})").empty());
    auto events = decoder.finish();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(as<PhaseChange>(events[0]).phase, Phase::Finished);
    EXPECT_TRUE(decoder.finish().empty());
}

TEST(StatusStreamDecoderTest, CrlfStripped) {
    StatusStreamDecoder decoder;
    auto events = decoder.feed("{\"status\":\"started\"}\r\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(as<PhaseChange>(events[0]).phase, Phase::Transcribing);
}

// Every split point, including inside the two-byte 'é' and the
// three-byte '€', yields the same decoded text.
TEST(StatusStreamDecoderTest, SplitAtEveryOffset) {
    const std::string stream =
        "{\"status\":\"loading\",\"message\":\"mod\xC3\xA8le\"}\n"
        "[00:00.000 --> 00:06.250] caf\xC3\xA9 \xE2\x82\xAC 5\n"
        "plain text line\n";

    StatusStreamDecoder reference;
    auto expected = reference.feed(stream);
    ASSERT_EQ(expected.size(), 3u);
    ASSERT_EQ(as<PhaseChange>(expected[0]).message, "mod\xC3\xA8le");
    ASSERT_EQ(as<Unrecognized>(expected[2]).line, "plain text line");

    for (std::size_t split = 0; split <= stream.size(); ++split) {
        StatusStreamDecoder decoder;
        auto events = decoder.feed(stream.substr(0, split));
        auto rest = decoder.feed(stream.substr(split));
        events.insert(events.end(), rest.begin(), rest.end());
        auto tail = decoder.finish();
        events.insert(events.end(), tail.begin(), tail.end());

        ASSERT_EQ(events.size(), 3u) << "split at " << split;
        EXPECT_EQ(as<PhaseChange>(events[0]).message, "mod\xC3\xA8le") << "split at " << split;
        EXPECT_DOUBLE_EQ(as<TimestampProgress>(events[1]).seconds, 6.25) << "split at " << split;
        EXPECT_EQ(as<Unrecognized>(events[2]).line, "plain text line") << "split at " << split;
    }
}

TEST(StatusStreamDecoderTest, OversizedLineDiscarded) {
    StatusStreamDecoder decoder(64);
    auto events = decoder.feed(std::string(100, 'x'));
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(decoder.pendingBytes(), 0u);

    events = decoder.feed("\n{\"status\":\"started\"}\n");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<PhaseChange>(events[1]));
}

}
