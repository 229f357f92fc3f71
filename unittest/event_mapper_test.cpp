// ============================================================================
// EVENT MAPPER UNIT TESTS
// ============================================================================
// Frame -> {type, data} mapping and JSON line rendering
// ============================================================================

#include <gtest/gtest.h>
#include <amzstream/core/events/event_mapper.hpp>
#include <amzstream/core/codec/frame_encoder.hpp>
#include <amzstream/core/decoder/stream_decoder.hpp>
#include "test_helpers.hpp"

using namespace AmzStream;
using AmzStreamTest::bytesOf;

namespace {

Frame makeFrame(const std::string& eventType, const std::string& payload) {
    Frame frame;
    frame.headers[kEventTypeHeader] = eventType;
    frame.payload = bytesOf(payload);
    return frame;
}

} // anonymous namespace

TEST(EventMapper, EmptyPayloadYieldsNullData) {
    AppEvent event = toEvent(makeFrame("end", ""));
    EXPECT_EQ(event.type, "end");
    EXPECT_TRUE(event.data.is_null());
}

TEST(EventMapper, AbsentPayloadYieldsNullData) {
    Frame frame;
    frame.headers[kEventTypeHeader] = std::string("ping");

    AppEvent event = toEvent(frame);
    EXPECT_EQ(event.type, "ping");
    EXPECT_TRUE(event.data.is_null());
}

TEST(EventMapper, JsonPayloadIsParsed) {
    AppEvent event = toEvent(makeFrame("assistantResponseEvent", "{\"a\":1}"));
    EXPECT_EQ(event.type, "assistantResponseEvent");
    ASSERT_TRUE(event.data.is_object());
    EXPECT_EQ(event.data["a"], 1);
}

TEST(EventMapper, JsonScalarsAndArraysAreParsed) {
    EXPECT_EQ(toEvent(makeFrame("n", "42")).data, 42);
    EXPECT_EQ(toEvent(makeFrame("s", "\"quoted\"")).data, "quoted");
    EXPECT_TRUE(toEvent(makeFrame("a", "[1,2,3]")).data.is_array());
}

TEST(EventMapper, NonJsonPayloadFallsBackToText) {
    AppEvent event = toEvent(makeFrame("chat", "hi"));
    EXPECT_EQ(event.type, "chat");
    ASSERT_TRUE(event.data.is_string());
    EXPECT_EQ(event.data.get<std::string>(), "hi");
}

TEST(EventMapper, TruncatedJsonFallsBackToText) {
    AppEvent event = toEvent(makeFrame("chat", "{\"content\":\"par"));
    ASSERT_TRUE(event.data.is_string());
    EXPECT_EQ(event.data.get<std::string>(), "{\"content\":\"par");
}

TEST(EventMapper, MissingEventTypeIsEmpty) {
    Frame frame;
    frame.payload = bytesOf("{}");
    EXPECT_EQ(toEvent(frame).type, "");
}

TEST(EventMapper, NonStringEventTypeIsEmpty) {
    Frame frame;
    frame.headers[kEventTypeHeader] = static_cast<int32_t>(5);
    frame.payload = bytesOf("{}");
    EXPECT_EQ(toEvent(frame).type, "");
}

TEST(EventMapper, NestedFrameIsMappedThroughInner) {
    Frame outer;
    outer.headers[kContentTypeHeader] = std::string(kNestedStreamContentType);
    outer.nested = std::make_unique<Frame>(makeFrame("inner", "{\"b\":true}"));

    AppEvent event = toEvent(outer);
    EXPECT_EQ(event.type, "inner");
    EXPECT_EQ(event.data["b"], true);
}

TEST(EventMapper, DecodedStreamMapsEndToEnd) {
    FrameEncoder encoder;
    StreamDecoder decoder;
    decoder.feed(encoder.encodeEvent("assistantResponseEvent", "{\"content\":\"hello\"}"));
    decoder.feed(encoder.encodeEvent("end", ""));

    auto frames = decoder.decode();
    ASSERT_EQ(frames.size(), 2u);

    AppEvent first = toEvent(frames[0]);
    EXPECT_EQ(first.type, "assistantResponseEvent");
    EXPECT_EQ(first.data["content"], "hello");

    AppEvent last = toEvent(frames[1]);
    EXPECT_EQ(last.type, "end");
    EXPECT_TRUE(last.data.is_null());
}

// ============================================================================
// JSON LINE RENDERING
// ============================================================================

TEST(EventMapper, JsonLineRendering) {
    EXPECT_EQ(toJsonLine(toEvent(makeFrame("end", ""))), "{\"data\":null,\"type\":\"end\"}");
    EXPECT_EQ(toJsonLine(toEvent(makeFrame("x", "{\"a\":1}"))), "{\"data\":{\"a\":1},\"type\":\"x\"}");
}

TEST(EventMapper, InvalidUtf8TextDoesNotThrow) {
    Frame frame;
    frame.headers[kEventTypeHeader] = std::string("raw");
    frame.payload = std::vector<uint8_t>{'o', 'k', 0xFF, 0xFE};

    AppEvent event = toEvent(frame);
    ASSERT_TRUE(event.data.is_string());
    EXPECT_NO_THROW(toJsonLine(event));
}
