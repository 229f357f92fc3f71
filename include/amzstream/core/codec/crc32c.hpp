#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace AmzStream {

/**
 * @brief Checksum polynomials accepted for the prelude and message checksums
 *
 * Crc32c is the Castagnoli polynomial (0x82F63B78, reflected) computed from a
 * process-wide lookup table. Crc32 is the IEEE polynomial, delegated to zlib.
 */
enum class ChecksumAlgorithm : uint8_t {
    Crc32c = 0,
    Crc32 = 1
};

/**
 * @brief Continue a CRC32C computation
 * @param crc Value returned by a previous call, or 0 to start
 * @param data Bytes to fold in
 * @param len Number of bytes
 * @return Finalized CRC32C of everything folded in so far
 *
 * The lookup table is built on first use, once per process.
 */
uint32_t crc32cUpdate(uint32_t crc, const uint8_t* data, size_t len);

inline uint32_t crc32c(const uint8_t* data, size_t len) {
    return crc32cUpdate(0, data, len);
}

inline uint32_t crc32c(const std::vector<uint8_t>& data) {
    return crc32cUpdate(0, data.data(), data.size());
}

/**
 * @brief Compute a checksum with the selected polynomial
 */
uint32_t checksum(ChecksumAlgorithm algorithm, const uint8_t* data, size_t len);

/**
 * @brief Parse "crc32c" / "crc32"
 * @throws std::invalid_argument for any other name
 */
ChecksumAlgorithm checksumAlgorithmFromString(std::string_view name);

const char* toString(ChecksumAlgorithm algorithm);

} // namespace AmzStream
