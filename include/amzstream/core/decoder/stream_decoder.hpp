#pragma once

#include <amzstream/core/codec/frame.hpp>
#include <amzstream/core/codec/frame_codec.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace AmzStream {

/**
 * @brief Thrown by feed() when a chunk would push the buffer past its ceiling
 */
class BufferOverflowError : public std::runtime_error {
public:
    explicit BufferOverflowError(const std::string& message) : std::runtime_error(message) {}
};

struct DecoderOptions {
    // Four maximum-size frames; only reachable when the caller stops decoding
    size_t maxBufferBytes = 4 * kMaxFrameSize;

    // Rethrow FormatError instead of skipping a byte, and fail on bad gzip
    bool strict = false;

    FrameCodecOptions codec;
};

/**
 * @brief Decoder counters
 *
 * Plain integers: a decoder is driven by one caller at a time.
 */
struct DecoderStats {
    uint64_t frames_decoded = 0;         // Frames handed to the caller
    uint64_t nested_frames_unwrapped = 0;
    uint64_t bytes_consumed = 0;         // Bytes removed by successful extraction
    uint64_t resync_bytes_skipped = 0;   // Bytes removed one at a time after errors
    uint64_t resync_runs = 0;            // Consecutive skip sequences
    uint64_t format_errors = 0;
    uint64_t rejected_feeds = 0;         // Chunks refused by the buffer ceiling
};

/**
 * @brief Incremental decoder for one event-stream byte stream
 *
 * Owns a growable buffer. feed() appends raw chunks as they arrive, next()
 * pulls one complete frame at a time, and decode() drains every frame that is
 * complete right now. After a later feed(), decoding resumes where the last
 * call stopped.
 *
 * Malformed input: in the default lenient mode, a FormatError drops exactly
 * one byte from the front of the buffer and extraction is retried, so the
 * decoder finds the next valid prelude. In strict mode the error propagates and
 * the buffer is left as it was.
 *
 * Not thread-safe: callers serialize feed/next/decode.
 */
class StreamDecoder {
public:
    StreamDecoder() : StreamDecoder(DecoderOptions{}) {}
    explicit StreamDecoder(const DecoderOptions& options);

    StreamDecoder(const StreamDecoder&) = delete;
    StreamDecoder& operator=(const StreamDecoder&) = delete;
    StreamDecoder(StreamDecoder&&) = default;
    StreamDecoder& operator=(StreamDecoder&&) = default;

    /**
     * @brief Append a chunk to the buffer
     * @throws BufferOverflowError if the buffer would exceed maxBufferBytes;
     *         the buffer is unchanged in that case
     */
    void feed(const uint8_t* data, size_t len);

    void feed(const std::vector<uint8_t>& chunk) {
        feed(chunk.data(), chunk.size());
    }

    /**
     * @brief Extract the next complete frame
     * @return The frame (nested wrappers unwrapped one level), or std::nullopt
     *         when the buffer does not yet hold a complete frame
     * @throws FormatError in strict mode only
     */
    std::optional<Frame> next();

    /**
     * @brief Extract every frame that is complete right now
     * In strict mode, frames extracted before a FormatError are returned first
     * and the error is raised by the following call.
     * @throws FormatError in strict mode only, when no frame precedes the error
     */
    std::vector<Frame> decode();

    /// Bytes buffered and not yet consumed
    size_t buffered() const { return buffer_.size() - readOffset_; }

    /// Drop everything buffered; counters are kept
    void reset();

    const DecoderStats& stats() const { return stats_; }

private:
    void consume(size_t n);
    void compact();
    void finishResyncRun();

    DecoderOptions options_;
    FrameCodec codec_;

    std::vector<uint8_t> buffer_;
    size_t readOffset_ = 0;

    DecoderStats stats_;
    uint64_t resyncRun_ = 0;
    std::string resyncFirstError_;
};

} // namespace AmzStream
