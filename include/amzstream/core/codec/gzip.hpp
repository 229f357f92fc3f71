#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace AmzStream {

class GzipError : public std::runtime_error {
public:
    explicit GzipError(const std::string& message) : std::runtime_error(message) {}
};

/// True when the buffer starts with the gzip magic bytes 1F 8B
bool hasGzipMagic(const uint8_t* data, size_t len);

/**
 * @brief Inflate a gzip stream (one or more concatenated members)
 * @param data Compressed bytes
 * @param len Length of compressed bytes
 * @param maxOutput Upper bound on inflated size
 * @return Inflated bytes
 * @throws GzipError on corrupt or truncated input, or when output would exceed maxOutput
 */
std::vector<uint8_t> gunzip(const uint8_t* data, size_t len, size_t maxOutput);

/**
 * @brief Compress into a single gzip member
 * @throws GzipError if zlib reports a failure
 */
std::vector<uint8_t> gzipCompress(const uint8_t* data, size_t len, int level = 6);

inline std::vector<uint8_t> gzipCompress(const std::vector<uint8_t>& in, int level = 6) {
    return gzipCompress(in.data(), in.size(), level);
}

} // namespace AmzStream
