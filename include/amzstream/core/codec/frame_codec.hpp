#pragma once

#include <amzstream/core/codec/crc32c.hpp>
#include <amzstream/core/codec/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace AmzStream {

struct FrameCodecOptions {
    // Prelude and message checksums are read but only compared when set
    bool verifyChecksums = false;
    ChecksumAlgorithm checksumAlgorithm = ChecksumAlgorithm::Crc32c;

    // Frames wrapping frames deeper than this are rejected
    uint32_t maxNestingDepth = 8;

    // Gzip payloads inflating past this size keep their compressed bytes
    size_t maxDecompressedBytes = 64 * 1024 * 1024;

    // Surface a failed gzip inflation as FormatError instead of keeping raw bytes
    bool strictDecompression = false;
};

/**
 * @brief Validates and extracts exactly one frame from a byte buffer
 *
 * Stateless apart from its options; safe to reuse across buffers.
 */
class FrameCodec {
public:
    FrameCodec() = default;
    explicit FrameCodec(const FrameCodecOptions& options) : options_(options) {}

    /**
     * @brief Extract the frame starting at `offset`
     * @param data Buffer start
     * @param size Bytes available in the buffer
     * @param offset Position of the frame prelude
     * @return The frame, or std::nullopt when more bytes are needed (nothing consumed)
     * @throws FormatError when the bytes at offset cannot be a valid frame
     */
    std::optional<Frame> extract(const uint8_t* data, size_t size, size_t offset = 0) const;

    std::optional<Frame> extract(const std::vector<uint8_t>& buffer, size_t offset = 0) const {
        return extract(buffer.data(), buffer.size(), offset);
    }

private:
    std::optional<Frame> extractAt(const uint8_t* data, size_t size, size_t offset, uint32_t depth) const;
    void verifyPreludeChecksum(const uint8_t* frame) const;
    void verifyMessageChecksum(const uint8_t* frame, uint32_t totalLength) const;
    void decodePayload(Frame& frame, const uint8_t* begin, const uint8_t* end) const;

    FrameCodecOptions options_;
};

/**
 * @brief Extract one frame with default (lenient) options
 */
std::optional<Frame> extractFrame(const uint8_t* data, size_t size, size_t offset = 0);

inline std::optional<Frame> extractFrame(const std::vector<uint8_t>& buffer, size_t offset = 0) {
    return extractFrame(buffer.data(), buffer.size(), offset);
}

} // namespace AmzStream
