#include <amzstream/core/codec/crc32c.hpp>
#include <mutex>
#include <stdexcept>
#include <string>
#include <zlib.h>

namespace AmzStream {

namespace {

constexpr uint32_t kCrc32cPolynomial = 0x82F63B78;

const uint32_t* crc32cTable() {
    static uint32_t CRC32C_TABLE[256];
    static std::once_flag init_flag;

    std::call_once(init_flag, []() {
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t crc = i;
            for (int j = 0; j < 8; j++) {
                if (crc & 1)
                    crc = (crc >> 1) ^ kCrc32cPolynomial;
                else
                    crc >>= 1;
            }
            CRC32C_TABLE[i] = crc;
        }
    });

    return CRC32C_TABLE;
}

} // anonymous namespace

uint32_t crc32cUpdate(uint32_t crc, const uint8_t* data, size_t len) {
    const uint32_t* table = crc32cTable();
    crc ^= 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = (crc >> 8) ^ table[(crc ^ data[i]) & 0xFF];
    }
    return crc ^ 0xFFFFFFFF;
}

uint32_t checksum(ChecksumAlgorithm algorithm, const uint8_t* data, size_t len) {
    switch (algorithm) {
        case ChecksumAlgorithm::Crc32c:
            return crc32c(data, len);
        case ChecksumAlgorithm::Crc32: {
            // zlib takes uInt lengths; frames are capped at 16 MiB so one call suffices
            uLong crc = crc32(0L, Z_NULL, 0);
            crc = crc32(crc, data, static_cast<uInt>(len));
            return static_cast<uint32_t>(crc);
        }
    }
    throw std::invalid_argument("Unknown checksum algorithm");
}

ChecksumAlgorithm checksumAlgorithmFromString(std::string_view name) {
    if (name == "crc32c") return ChecksumAlgorithm::Crc32c;
    if (name == "crc32")  return ChecksumAlgorithm::Crc32;
    throw std::invalid_argument("Unknown checksum algorithm: " + std::string(name));
}

const char* toString(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::Crc32c: return "crc32c";
        case ChecksumAlgorithm::Crc32:  return "crc32";
    }
    return "unknown";
}

} // namespace AmzStream
