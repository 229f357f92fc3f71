#pragma once

#include <amzstream/core/codec/crc32c.hpp>
#include <amzstream/core/codec/header_value.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace AmzStream {

/**
 * @brief Builds wire-ready event-stream messages
 *
 * Output always carries valid prelude and message checksums for the
 * configured algorithm, so it decodes with verification enabled.
 */
class FrameEncoder {
public:
    explicit FrameEncoder(ChecksumAlgorithm algorithm = ChecksumAlgorithm::Crc32c)
        : algorithm_(algorithm) {}

    /**
     * @brief Encode one message
     * @throws std::invalid_argument if a header cannot be encoded or the
     *         message would exceed the 16 MiB frame limit
     */
    std::vector<uint8_t> encode(const HeaderMap& headers, const std::vector<uint8_t>& payload) const;

    /**
     * @brief Encode an event message with a text payload
     *
     * Sets :message-type to "event", :event-type to eventType and
     * :content-type to "application/json".
     */
    std::vector<uint8_t> encodeEvent(const std::string& eventType, const std::string& body) const;

    /**
     * @brief Wrap an encoded message as the payload of a nested-stream message
     */
    std::vector<uint8_t> wrapNested(const std::vector<uint8_t>& innerMessage,
                                    HeaderMap extraHeaders = {}) const;

private:
    ChecksumAlgorithm algorithm_;
};

} // namespace AmzStream
