//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stream_decoder.cpp
// Purpose: StreamDecoder ordering, chunk-boundary invariance and buffer ceiling
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mcpio/MessageFramer.h"

using namespace mcpio;

namespace {
struct Collector {
    std::vector<std::string> methods;
    std::vector<WireMode> modes;
    std::vector<errors::EngineError> errors;

    void attach(StreamDecoder& d) {
        d.SetMessageCallback([this](JSONValue msg, WireMode mode) {
            methods.push_back(GetStringMember(msg, "method").value_or("?"));
            modes.push_back(mode);
        });
        d.SetErrorCallback([this](const errors::EngineError& e) { errors.push_back(e); });
    }
};

std::string framed(const std::string& body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::string note(const std::string& method) {
    return R"({"jsonrpc":"2.0","method":")" + method + R"(","params":{"s":"} {\"x\""}})";
}

// Mixed stream: header-framed, noise, line-delimited, header-framed
std::string mixedStream() {
    return framed(note("one")) + "server log line\n" + note("two") + "\n" + framed(note("three"));
}
} // namespace

TEST(StreamDecoderTest, MixedFormatsDeliveredInOrder) {
    StreamDecoder decoder;
    Collector c;
    c.attach(decoder);
    EXPECT_EQ(decoder.Feed(mixedStream()), 3u);
    ASSERT_EQ(c.methods.size(), 3u);
    EXPECT_EQ(c.methods[0], "one");
    EXPECT_EQ(c.methods[1], "two");
    EXPECT_EQ(c.methods[2], "three");
    EXPECT_EQ(c.modes[0], WireMode::HeaderFramed);
    EXPECT_EQ(c.modes[1], WireMode::LineDelimited);
    EXPECT_EQ(c.modes[2], WireMode::HeaderFramed);
    EXPECT_TRUE(c.errors.empty());
    EXPECT_EQ(decoder.BufferedBytes(), 0u);
}

TEST(StreamDecoderTest, ChunkBoundariesDoNotChangeResult) {
    const std::string stream = mixedStream();
    for (std::size_t chunk : {std::size_t{1}, std::size_t{2}, std::size_t{3}, std::size_t{7}, std::size_t{16}}) {
        StreamDecoder decoder;
        Collector c;
        c.attach(decoder);
        for (std::size_t pos = 0; pos < stream.size(); pos += chunk) {
            decoder.Feed(std::string_view(stream).substr(pos, chunk));
        }
        ASSERT_EQ(c.methods.size(), 3u) << "chunk size " << chunk;
        EXPECT_EQ(c.methods[0], "one");
        EXPECT_EQ(c.methods[1], "two");
        EXPECT_EQ(c.methods[2], "three");
        EXPECT_TRUE(c.errors.empty()) << "chunk size " << chunk;
    }
}

TEST(StreamDecoderTest, HeaderSplitAtEveryOffset) {
    const std::string stream = framed(note("split"));
    for (std::size_t cut = 1; cut < stream.size(); ++cut) {
        StreamDecoder decoder;
        Collector c;
        c.attach(decoder);
        decoder.Feed(std::string_view(stream).substr(0, cut));
        decoder.Feed(std::string_view(stream).substr(cut));
        ASSERT_EQ(c.methods.size(), 1u) << "cut at " << cut;
        EXPECT_EQ(c.methods[0], "split");
    }
}

TEST(StreamDecoderTest, BadFrameReportedAndStreamContinues) {
    StreamDecoder decoder;
    Collector c;
    c.attach(decoder);
    decoder.Feed("Content-Length: 5\r\n\r\nhello" + framed(note("after")));
    ASSERT_EQ(c.errors.size(), 1u);
    EXPECT_EQ(c.errors[0].errorClass, errors::ErrorClass::Framing);
    ASSERT_EQ(c.methods.size(), 1u);
    EXPECT_EQ(c.methods[0], "after");
}

TEST(StreamDecoderTest, CeilingResetsBufferWithOneError) {
    StreamDecoder decoder(64);
    Collector c;
    c.attach(decoder);
    decoder.Feed(R"({"jsonrpc":"2.0","method":"partial","params":{)");
    EXPECT_GT(decoder.BufferedBytes(), 0u);

    EXPECT_EQ(decoder.Feed(std::string(40, 'x')), 0u);
    ASSERT_EQ(c.errors.size(), 1u);
    EXPECT_EQ(c.errors[0].errorClass, errors::ErrorClass::ResourceExhaustion);
    EXPECT_EQ(decoder.BufferedBytes(), 0u);

    // Later well-formed input decodes normally
    decoder.Feed(R"({"jsonrpc":"2.0","method":"ok"})");
    ASSERT_EQ(c.methods.size(), 1u);
    EXPECT_EQ(c.methods[0], "ok");
    EXPECT_EQ(c.errors.size(), 1u);
}

TEST(StreamDecoderTest, ResetFromCallbackStopsDecoding) {
    StreamDecoder decoder;
    int seen = 0;
    decoder.SetMessageCallback([&](JSONValue, WireMode) {
        ++seen;
        decoder.Reset();
    });
    decoder.Feed(note("a") + note("b"));
    EXPECT_EQ(seen, 1);
    EXPECT_EQ(decoder.BufferedBytes(), 0u);
}
