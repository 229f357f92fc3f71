#include <amzstream/core/codec/format_error.hpp>

namespace AmzStream {

const char* toString(FormatErrorKind kind) {
    switch (kind) {
        case FormatErrorKind::InvalidLength:       return "invalid length";
        case FormatErrorKind::UnknownHeaderType:   return "unknown header type";
        case FormatErrorKind::TruncatedHeader:     return "truncated header";
        case FormatErrorKind::ChecksumMismatch:    return "checksum mismatch";
        case FormatErrorKind::NestingTooDeep:      return "nesting too deep";
        case FormatErrorKind::DecompressionFailed: return "decompression failed";
    }
    return "unknown";
}

} // namespace AmzStream
