#include <amzstream/core/codec/frame_codec.hpp>
#include <amzstream/core/codec/format_error.hpp>
#include <amzstream/core/codec/gzip.hpp>
#include <amzstream/core/codec/header_codec.hpp>
#include <amzstream/core/utils/byte_order.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace AmzStream {

std::optional<Frame> FrameCodec::extract(const uint8_t* data, size_t size, size_t offset) const {
    return extractAt(data, size, offset, 0);
}

std::optional<Frame> FrameCodec::extractAt(const uint8_t* data, size_t size, size_t offset,
                                           uint32_t depth) const {
    if (offset > size || size - offset < kMinFrameSize)
        return std::nullopt;

    const uint8_t* frame = data + offset;
    uint32_t totalLength = readUint32BE(frame);
    uint32_t headersLength = readUint32BE(frame + 4);

    if (totalLength < kMinFrameSize || totalLength > kMaxFrameSize) {
        throw FormatError(FormatErrorKind::InvalidLength,
                          "Invalid message length: " + std::to_string(totalLength));
    }
    if (headersLength > totalLength - kMinFrameSize) {
        throw FormatError(FormatErrorKind::InvalidLength,
                          "Headers length " + std::to_string(headersLength) +
                          " exceeds message length " + std::to_string(totalLength));
    }

    // The prelude checksum needs only the first 12 bytes, so a bad prelude is
    // rejected before waiting on a length that may be garbage.
    if (options_.verifyChecksums)
        verifyPreludeChecksum(frame);

    if (size - offset < totalLength)
        return std::nullopt;  // Wait for more data

    if (options_.verifyChecksums)
        verifyMessageChecksum(frame, totalLength);

    const uint8_t* headersBegin = frame + kPreludeSize;
    const uint8_t* payloadBegin = headersBegin + headersLength;
    const uint8_t* payloadEnd = frame + totalLength - kMessageChecksumSize;

    Frame result;
    result.headers = decodeHeaders(headersBegin, headersLength);
    result.consumedBytes = totalLength;

    const std::string* contentType = result.header(kContentTypeHeader);

    if (contentType && *contentType == kNestedStreamContentType) {
        if (depth >= options_.maxNestingDepth) {
            throw FormatError(FormatErrorKind::NestingTooDeep,
                              "Nested event stream exceeds depth " +
                              std::to_string(options_.maxNestingDepth));
        }

        size_t innerSize = static_cast<size_t>(payloadEnd - payloadBegin);
        auto inner = extractAt(payloadBegin, innerSize, 0, depth + 1);
        // An inner region too short for a whole frame still consumes the
        // outer frame; it is returned with neither payload nor nested.
        if (inner)
            result.nested = std::make_unique<Frame>(std::move(*inner));
        else
            spdlog::debug("[FrameCodec] Nested region of {} bytes holds no complete message", innerSize);
        return result;
    }

    decodePayload(result, payloadBegin, payloadEnd);
    return result;
}

void FrameCodec::verifyPreludeChecksum(const uint8_t* frame) const {
    uint32_t expectedPrelude = readUint32BE(frame + 8);
    uint32_t actualPrelude = checksum(options_.checksumAlgorithm, frame, 8);
    if (expectedPrelude != actualPrelude) {
        throw FormatError(FormatErrorKind::ChecksumMismatch,
                          fmt::format("Prelude checksum mismatch: expected {:#010x}, computed {:#010x}",
                                      expectedPrelude, actualPrelude));
    }
}

void FrameCodec::verifyMessageChecksum(const uint8_t* frame, uint32_t totalLength) const {
    size_t coveredLength = totalLength - kMessageChecksumSize;
    uint32_t expectedMessage = readUint32BE(frame + coveredLength);
    uint32_t actualMessage = checksum(options_.checksumAlgorithm, frame, coveredLength);
    if (expectedMessage != actualMessage) {
        throw FormatError(FormatErrorKind::ChecksumMismatch,
                          fmt::format("Message checksum mismatch: expected {:#010x}, computed {:#010x}",
                                      expectedMessage, actualMessage));
    }
}

void FrameCodec::decodePayload(Frame& frame, const uint8_t* begin, const uint8_t* end) const {
    size_t len = static_cast<size_t>(end - begin);

    if (hasGzipMagic(begin, len)) {
        try {
            frame.payload = gunzip(begin, len, options_.maxDecompressedBytes);
            frame.decompressed = true;
            return;
        } catch (const GzipError& e) {
            if (options_.strictDecompression)
                throw FormatError(FormatErrorKind::DecompressionFailed, e.what());
            spdlog::debug("[FrameCodec] Gzip inflate failed ({}), keeping {} raw payload bytes",
                          e.what(), len);
        }
    }

    frame.payload.emplace(begin, end);
}

std::optional<Frame> extractFrame(const uint8_t* data, size_t size, size_t offset) {
    static const FrameCodec defaultCodec{};
    return defaultCodec.extract(data, size, offset);
}

} // namespace AmzStream
