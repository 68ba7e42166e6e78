/*
 * scriba - Transcription Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "scriba/whisper_model.hpp"
#include "test_support.hpp"

using namespace scriba;
using scriba::test::TempDir;

namespace {

void putU16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void putU32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

// PCM16 WAV with an extra LIST chunk before the data.
std::string pcm16Wav(uint32_t rate, uint16_t channels, const std::vector<int16_t>& samples) {
    std::string data;
    for (int16_t s : samples) {
        putU16(data, static_cast<uint16_t>(s));
    }

    std::string body = "WAVE";
    body += "fmt ";
    putU32(body, 16);
    putU16(body, 1);
    putU16(body, channels);
    putU32(body, rate);
    putU32(body, rate * channels * 2);
    putU16(body, static_cast<uint16_t>(channels * 2));
    putU16(body, 16);
    body += "LIST";
    putU32(body, 3);
    body += "abc";
    body.push_back('\0');
    body += "data";
    putU32(body, static_cast<uint32_t>(data.size()));
    body += data;

    std::string wav = "RIFF";
    putU32(wav, static_cast<uint32_t>(body.size()));
    return wav + body;
}

TEST(WavReaderTest, MonoPcm16) {
    TempDir dir;
    auto path = dir.write("mono.wav", pcm16Wav(16000, 1, {0, 16384, -16384, 32767}));

    std::vector<float> pcm;
    std::string error;
    ASSERT_TRUE(readWav16k(path, pcm, error)) << error;
    ASSERT_EQ(pcm.size(), 4u);
    EXPECT_FLOAT_EQ(pcm[0], 0.0f);
    EXPECT_FLOAT_EQ(pcm[1], 0.5f);
    EXPECT_FLOAT_EQ(pcm[2], -0.5f);
    EXPECT_NEAR(pcm[3], 1.0f, 1e-4);
}

TEST(WavReaderTest, StereoIsDownmixed) {
    TempDir dir;
    auto path = dir.write("stereo.wav", pcm16Wav(16000, 2, {16384, 0, -16384, -16384}));

    std::vector<float> pcm;
    std::string error;
    ASSERT_TRUE(readWav16k(path, pcm, error)) << error;
    ASSERT_EQ(pcm.size(), 2u);
    EXPECT_FLOAT_EQ(pcm[0], 0.25f);
    EXPECT_FLOAT_EQ(pcm[1], -0.5f);
}

TEST(WavReaderTest, RejectsOtherRates) {
    TempDir dir;
    auto path = dir.write("cd.wav", pcm16Wav(44100, 1, {1, 2, 3}));

    std::vector<float> pcm;
    std::string error;
    EXPECT_FALSE(readWav16k(path, pcm, error));
    EXPECT_NE(error.find("44100 Hz"), std::string::npos) << error;
}

TEST(WavReaderTest, RejectsNonWav) {
    TempDir dir;
    std::vector<float> pcm;
    std::string error;

    EXPECT_FALSE(readWav16k(dir.write("clip.mp3", std::string(64, 'x')), pcm, error));
    EXPECT_NE(error.find("RIFF/WAVE"), std::string::npos) << error;

    EXPECT_FALSE(readWav16k(dir.path() / "missing.wav", pcm, error));
    EXPECT_FALSE(error.empty());
}

}
