#include <amzstream/core/codec/frame_encoder.hpp>
#include <amzstream/core/codec/frame.hpp>
#include <amzstream/core/codec/header_codec.hpp>
#include <amzstream/core/utils/byte_order.hpp>
#include <stdexcept>

namespace AmzStream {

std::vector<uint8_t> FrameEncoder::encode(const HeaderMap& headers,
                                          const std::vector<uint8_t>& payload) const {
    std::vector<uint8_t> headerBytes = encodeHeaders(headers);

    size_t totalLength = kMinFrameSize + headerBytes.size() + payload.size();
    if (totalLength > kMaxFrameSize) {
        throw std::invalid_argument("Encoded message of " + std::to_string(totalLength) +
                                    " bytes exceeds the 16 MiB limit");
    }

    std::vector<uint8_t> out;
    out.reserve(totalLength);

    appendUint32BE(out, static_cast<uint32_t>(totalLength));
    appendUint32BE(out, static_cast<uint32_t>(headerBytes.size()));
    appendUint32BE(out, checksum(algorithm_, out.data(), 8));

    out.insert(out.end(), headerBytes.begin(), headerBytes.end());
    out.insert(out.end(), payload.begin(), payload.end());

    appendUint32BE(out, checksum(algorithm_, out.data(), out.size()));
    return out;
}

std::vector<uint8_t> FrameEncoder::encodeEvent(const std::string& eventType,
                                               const std::string& body) const {
    HeaderMap headers;
    headers[kMessageTypeHeader] = std::string("event");
    headers[kEventTypeHeader] = eventType;
    headers[kContentTypeHeader] = std::string("application/json");
    return encode(headers, std::vector<uint8_t>(body.begin(), body.end()));
}

std::vector<uint8_t> FrameEncoder::wrapNested(const std::vector<uint8_t>& innerMessage,
                                              HeaderMap extraHeaders) const {
    extraHeaders[kContentTypeHeader] = std::string(kNestedStreamContentType);
    return encode(extraHeaders, innerMessage);
}

} // namespace AmzStream
