#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace AmzStream {

enum class FormatErrorKind : uint8_t {
    InvalidLength = 0,
    UnknownHeaderType,
    TruncatedHeader,
    ChecksumMismatch,
    NestingTooDeep,
    DecompressionFailed
};

const char* toString(FormatErrorKind kind);

/**
 * @brief Raised when wire bytes do not form a valid frame
 *
 * The codec never recovers from a FormatError itself. The stream decoder
 * either resynchronizes past it (lenient) or rethrows it (strict).
 */
class FormatError : public std::runtime_error {
public:
    FormatError(FormatErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FormatErrorKind kind() const noexcept { return kind_; }

private:
    FormatErrorKind kind_;
};

} // namespace AmzStream
