#pragma once

#include <amzstream/core/codec/header_value.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace AmzStream {

/**
 * @brief Decode a contiguous header region
 * @param data Pointer to the first header record
 * @param len Length of the header region in bytes
 * @return Headers in name order; a repeated name keeps its last value
 * @throws FormatError UnknownHeaderType for a tag outside 0-9,
 *         TruncatedHeader when a record runs past the region
 */
HeaderMap decodeHeaders(const uint8_t* data, size_t len);

inline HeaderMap decodeHeaders(const std::vector<uint8_t>& region) {
    return decodeHeaders(region.data(), region.size());
}

/**
 * @brief Encode headers into wire records
 * @throws std::invalid_argument if a name exceeds 255 bytes or a byte/string
 *         value exceeds 65535 bytes
 */
std::vector<uint8_t> encodeHeaders(const HeaderMap& headers);

/**
 * @brief Append a single header record
 */
void appendHeader(std::vector<uint8_t>& out, const std::string& name, const HeaderValue& value);

} // namespace AmzStream
