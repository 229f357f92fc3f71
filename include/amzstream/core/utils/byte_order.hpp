#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace AmzStream {

// Big-endian accessors over raw wire bytes. Callers are responsible for
// bounds checks; these never look past the width they read.

inline uint8_t readUint8(const uint8_t* data) {
    return *data;
}

inline uint16_t readUint16BE(const uint8_t* data) {
    uint16_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohs(v);
}

inline uint32_t readUint32BE(const uint8_t* data) {
    uint32_t v;
    std::memcpy(&v, data, sizeof(v));
    return ntohl(v);
}

inline uint64_t readUint64BE(const uint8_t* data) {
    return (static_cast<uint64_t>(readUint32BE(data)) << 32) |
            static_cast<uint64_t>(readUint32BE(data + 4));
}

inline void appendUint8(std::vector<uint8_t>& out, uint8_t v) {
    out.push_back(v);
}

inline void appendUint16BE(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void appendUint32BE(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void appendUint64BE(std::vector<uint8_t>& out, uint64_t v) {
    appendUint32BE(out, static_cast<uint32_t>(v >> 32));
    appendUint32BE(out, static_cast<uint32_t>(v & 0xFFFFFFFFu));
}

// Overwrites 4 bytes at `dst`; used to patch lengths and checksums in place.
inline void writeUint32BE(uint8_t* dst, uint32_t v) {
    uint32_t be = htonl(v);
    std::memcpy(dst, &be, sizeof(be));
}

} // namespace AmzStream
