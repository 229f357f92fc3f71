#include <amzstream/core/codec/header_value.hpp>

namespace AmzStream {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

template <typename It>
std::string toHex(It begin, It end) {
    std::string out;
    out.reserve(static_cast<size_t>(end - begin) * 2);
    for (auto it = begin; it != end; ++it) {
        out.push_back(kHexDigits[(*it >> 4) & 0x0F]);
        out.push_back(kHexDigits[*it & 0x0F]);
    }
    return out;
}

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // anonymous namespace

std::string Uuid::toHex() const {
    return AmzStream::toHex(bytes.begin(), bytes.end());
}

HeaderType headerTypeOf(const HeaderValue& value) {
    return std::visit(overloaded{
        [](bool b)               { return b ? HeaderType::BoolTrue : HeaderType::BoolFalse; },
        [](int8_t)               { return HeaderType::Byte; },
        [](int16_t)              { return HeaderType::Short; },
        [](int32_t)              { return HeaderType::Int; },
        [](int64_t)              { return HeaderType::Long; },
        [](const ByteString&)    { return HeaderType::Bytes; },
        [](const std::string&)   { return HeaderType::String; },
        [](const Timestamp&)     { return HeaderType::Timestamp; },
        [](const Uuid&)          { return HeaderType::Uuid; }
    }, value);
}

std::string toString(const HeaderValue& value) {
    return std::visit(overloaded{
        [](bool b)               { return std::string(b ? "true" : "false"); },
        [](int8_t v)             { return std::to_string(static_cast<int>(v)); },
        [](int16_t v)            { return std::to_string(v); },
        [](int32_t v)            { return std::to_string(v); },
        [](int64_t v)            { return std::to_string(v); },
        [](const ByteString& b)  { return AmzStream::toHex(b.begin(), b.end()); },
        [](const std::string& s) { return s; },
        [](const Timestamp& t)   { return std::to_string(t.millis); },
        [](const Uuid& u)        { return u.toHex(); }
    }, value);
}

const std::string* findStringHeader(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(name);
    if (it == headers.end()) return nullptr;
    return std::get_if<std::string>(&it->second);
}

} // namespace AmzStream
