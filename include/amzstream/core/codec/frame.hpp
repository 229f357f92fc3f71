#pragma once

#include <amzstream/core/codec/header_value.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace AmzStream {

constexpr size_t kPreludeSize = 12;          // total_length + headers_length + prelude_crc
constexpr size_t kMessageChecksumSize = 4;
constexpr size_t kMinFrameSize = kPreludeSize + kMessageChecksumSize;
constexpr size_t kMaxFrameSize = 16 * 1024 * 1024;

constexpr const char* kContentTypeHeader = ":content-type";
constexpr const char* kEventTypeHeader = ":event-type";
constexpr const char* kMessageTypeHeader = ":message-type";
constexpr const char* kNestedStreamContentType = "application/vnd.amazon.eventstream";

/**
 * @brief One decoded event-stream message
 *
 * A frame whose :content-type marks a nested stream has no payload; it owns
 * `nested` unless its region held no complete frame. Every other frame owns a
 * payload, possibly empty. Frames hold no
 * reference to the buffer they were decoded from.
 */
struct Frame {
    HeaderMap headers;
    std::optional<std::vector<uint8_t>> payload;
    std::unique_ptr<Frame> nested;
    uint32_t consumedBytes = 0;

    // Set when the payload arrived gzip-compressed and was inflated
    bool decompressed = false;

    bool isNested() const { return nested != nullptr; }

    const std::string* header(const std::string& name) const {
        return findStringHeader(headers, name);
    }

    size_t payloadSize() const { return payload ? payload->size() : 0; }
};

} // namespace AmzStream
