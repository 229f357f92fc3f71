#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace AmzStream {

/**
 * @brief Header value type tags as they appear on the wire
 */
enum class HeaderType : uint8_t {
    BoolTrue = 0,
    BoolFalse = 1,
    Byte = 2,
    Short = 3,
    Int = 4,
    Long = 5,
    Bytes = 6,
    String = 7,
    Timestamp = 8,
    Uuid = 9
};

constexpr uint8_t kMaxHeaderTypeTag = static_cast<uint8_t>(HeaderType::Uuid);

using ByteString = std::vector<uint8_t>;

// Milliseconds since the Unix epoch. Kept distinct from int64_t so the
// variant can tell a timestamp header from a long header.
struct Timestamp {
    int64_t millis = 0;

    bool operator==(const Timestamp& other) const { return millis == other.millis; }
    bool operator!=(const Timestamp& other) const { return millis != other.millis; }
};

struct Uuid {
    std::array<uint8_t, 16> bytes{};

    /// 32 lowercase hex characters, no dashes
    std::string toHex() const;

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
};

/**
 * @brief Closed set of decoded header values
 *
 * Alternative order does not follow the wire tags: tags 0 and 1 both map to
 * bool. Use headerTypeOf() to recover the tag a value encodes to.
 */
using HeaderValue = std::variant<
    bool,
    int8_t,
    int16_t,
    int32_t,
    int64_t,
    ByteString,
    std::string,
    Timestamp,
    Uuid>;

/// Name -> value; a name repeated within one frame keeps the last value
using HeaderMap = std::map<std::string, HeaderValue>;

HeaderType headerTypeOf(const HeaderValue& value);

/**
 * @brief Human-readable rendering used for logging and the dump tool
 *
 * Byte strings render as hex, timestamps as their millisecond count.
 */
std::string toString(const HeaderValue& value);

/**
 * @brief Look up a header holding a UTF-8 string
 * @return Pointer into the map, or nullptr when the header is missing or not a string
 */
const std::string* findStringHeader(const HeaderMap& headers, const std::string& name);

} // namespace AmzStream
