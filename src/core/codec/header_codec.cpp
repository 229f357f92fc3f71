#include <amzstream/core/codec/header_codec.hpp>
#include <amzstream/core/codec/format_error.hpp>
#include <amzstream/core/utils/byte_order.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace AmzStream {

namespace {

// Cursor over the header region. Every read checks the remaining length so a
// lying length byte surfaces as TruncatedHeader instead of an overread.
class HeaderReader {
public:
    HeaderReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    bool done() const { return pos_ >= len_; }

    const uint8_t* take(size_t n, const char* what) {
        if (len_ - pos_ < n) {
            throw FormatError(FormatErrorKind::TruncatedHeader,
                              std::string("Header region too small for ") + what +
                              " (need " + std::to_string(n) + " bytes at offset " +
                              std::to_string(pos_) + ", have " + std::to_string(len_ - pos_) + ")");
        }
        const uint8_t* p = data_ + pos_;
        pos_ += n;
        return p;
    }

    uint8_t u8(const char* what) { return readUint8(take(1, what)); }
    uint16_t u16(const char* what) { return readUint16BE(take(2, what)); }
    uint32_t u32(const char* what) { return readUint32BE(take(4, what)); }
    uint64_t u64(const char* what) { return readUint64BE(take(8, what)); }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

HeaderValue readValue(HeaderReader& reader, uint8_t tag) {
    switch (static_cast<HeaderType>(tag)) {
        case HeaderType::BoolTrue:
            return true;
        case HeaderType::BoolFalse:
            return false;
        case HeaderType::Byte:
            return static_cast<int8_t>(reader.u8("byte value"));
        case HeaderType::Short:
            return static_cast<int16_t>(reader.u16("short value"));
        case HeaderType::Int:
            return static_cast<int32_t>(reader.u32("int value"));
        case HeaderType::Long:
            return static_cast<int64_t>(reader.u64("long value"));
        case HeaderType::Bytes: {
            uint16_t n = reader.u16("bytes length");
            const uint8_t* p = reader.take(n, "bytes value");
            return ByteString(p, p + n);
        }
        case HeaderType::String: {
            uint16_t n = reader.u16("string length");
            const uint8_t* p = reader.take(n, "string value");
            return std::string(reinterpret_cast<const char*>(p), n);
        }
        case HeaderType::Timestamp:
            return Timestamp{static_cast<int64_t>(reader.u64("timestamp value"))};
        case HeaderType::Uuid: {
            const uint8_t* p = reader.take(16, "uuid value");
            Uuid uuid;
            std::copy(p, p + 16, uuid.bytes.begin());
            return uuid;
        }
    }
    throw FormatError(FormatErrorKind::UnknownHeaderType,
                      "Unknown header type: " + std::to_string(static_cast<int>(tag)));
}

} // anonymous namespace

HeaderMap decodeHeaders(const uint8_t* data, size_t len) {
    HeaderMap headers;
    HeaderReader reader(data, len);

    while (!reader.done()) {
        uint8_t nameLen = reader.u8("name length");
        const uint8_t* name = reader.take(nameLen, "name");
        uint8_t tag = reader.u8("type tag");

        if (tag > kMaxHeaderTypeTag) {
            throw FormatError(FormatErrorKind::UnknownHeaderType,
                              "Unknown header type: " + std::to_string(static_cast<int>(tag)));
        }

        headers.insert_or_assign(std::string(reinterpret_cast<const char*>(name), nameLen),
                                 readValue(reader, tag));
    }

    return headers;
}

void appendHeader(std::vector<uint8_t>& out, const std::string& name, const HeaderValue& value) {
    if (name.size() > std::numeric_limits<uint8_t>::max())
        throw std::invalid_argument("Header name exceeds 255 bytes: " + name.substr(0, 32) + "...");

    appendUint8(out, static_cast<uint8_t>(name.size()));
    out.insert(out.end(), name.begin(), name.end());

    HeaderType type = headerTypeOf(value);
    appendUint8(out, static_cast<uint8_t>(type));

    switch (type) {
        case HeaderType::BoolTrue:
        case HeaderType::BoolFalse:
            break;
        case HeaderType::Byte:
            appendUint8(out, static_cast<uint8_t>(std::get<int8_t>(value)));
            break;
        case HeaderType::Short:
            appendUint16BE(out, static_cast<uint16_t>(std::get<int16_t>(value)));
            break;
        case HeaderType::Int:
            appendUint32BE(out, static_cast<uint32_t>(std::get<int32_t>(value)));
            break;
        case HeaderType::Long:
            appendUint64BE(out, static_cast<uint64_t>(std::get<int64_t>(value)));
            break;
        case HeaderType::Bytes: {
            const auto& bytes = std::get<ByteString>(value);
            if (bytes.size() > std::numeric_limits<uint16_t>::max())
                throw std::invalid_argument("Bytes header '" + name + "' exceeds 65535 bytes");
            appendUint16BE(out, static_cast<uint16_t>(bytes.size()));
            out.insert(out.end(), bytes.begin(), bytes.end());
            break;
        }
        case HeaderType::String: {
            const auto& str = std::get<std::string>(value);
            if (str.size() > std::numeric_limits<uint16_t>::max())
                throw std::invalid_argument("String header '" + name + "' exceeds 65535 bytes");
            appendUint16BE(out, static_cast<uint16_t>(str.size()));
            out.insert(out.end(), str.begin(), str.end());
            break;
        }
        case HeaderType::Timestamp:
            appendUint64BE(out, static_cast<uint64_t>(std::get<Timestamp>(value).millis));
            break;
        case HeaderType::Uuid: {
            const auto& uuid = std::get<Uuid>(value);
            out.insert(out.end(), uuid.bytes.begin(), uuid.bytes.end());
            break;
        }
    }
}

std::vector<uint8_t> encodeHeaders(const HeaderMap& headers) {
    std::vector<uint8_t> out;
    for (const auto& [name, value] : headers) {
        appendHeader(out, name, value);
    }
    return out;
}

} // namespace AmzStream
