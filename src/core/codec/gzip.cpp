#include <amzstream/core/codec/gzip.hpp>
#include <zlib.h>
#include <algorithm>

namespace AmzStream {

namespace {

// windowBits + 16 selects the gzip wrapper in zlib
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr size_t kInflateChunk = 16 * 1024;

// Owns a z_stream for the lifetime of one inflate/deflate call
class ZStream {
public:
    ZStream() { stream_ = z_stream{}; }
    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;

    ~ZStream() {
        if (inflating_) inflateEnd(&stream_);
        if (deflating_) deflateEnd(&stream_);
    }

    void initInflate() {
        if (inflateInit2(&stream_, kGzipWindowBits) != Z_OK)
            throw GzipError("inflateInit2 failed");
        inflating_ = true;
    }

    void initDeflate(int level) {
        if (deflateInit2(&stream_, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
            throw GzipError("deflateInit2 failed");
        deflating_ = true;
    }

    z_stream* get() { return &stream_; }

private:
    z_stream stream_;
    bool inflating_ = false;
    bool deflating_ = false;
};

} // anonymous namespace

bool hasGzipMagic(const uint8_t* data, size_t len) {
    return len >= 2 && data[0] == 0x1F && data[1] == 0x8B;
}

std::vector<uint8_t> gunzip(const uint8_t* data, size_t len, size_t maxOutput) {
    ZStream zs;
    zs.initInflate();
    z_stream* s = zs.get();

    s->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    s->avail_in = static_cast<uInt>(len);

    std::vector<uint8_t> out;
    uint8_t chunk[kInflateChunk];

    for (;;) {
        s->next_out = chunk;
        s->avail_out = static_cast<uInt>(kInflateChunk);

        int rc = inflate(s, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            throw GzipError(std::string("inflate failed: ") + (s->msg ? s->msg : zError(rc)));
        }

        size_t produced = kInflateChunk - s->avail_out;
        if (out.size() + produced > maxOutput) {
            throw GzipError("inflated size exceeds limit of " + std::to_string(maxOutput) + " bytes");
        }
        out.insert(out.end(), chunk, chunk + produced);

        if (rc == Z_STREAM_END) {
            // Concatenated members are legal gzip; keep going while input remains
            if (s->avail_in == 0) break;
            // Zero padding after the last member ends the stream
            if (std::all_of(s->next_in, s->next_in + s->avail_in, [](uint8_t b) { return b == 0; }))
                break;
            if (!hasGzipMagic(s->next_in, s->avail_in))
                throw GzipError("trailing garbage after gzip member");
            if (inflateReset(s) != Z_OK)
                throw GzipError("inflateReset failed");
            continue;
        }

        if (s->avail_in == 0 && produced == 0) {
            throw GzipError("truncated gzip stream");
        }
    }

    return out;
}

std::vector<uint8_t> gzipCompress(const uint8_t* data, size_t len, int level) {
    ZStream zs;
    zs.initDeflate(level);
    z_stream* s = zs.get();

    std::vector<uint8_t> out(deflateBound(s, static_cast<uLong>(len)));
    s->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    s->avail_in = static_cast<uInt>(len);
    s->next_out = out.data();
    s->avail_out = static_cast<uInt>(out.size());

    int rc = deflate(s, Z_FINISH);
    if (rc != Z_STREAM_END) {
        throw GzipError(std::string("deflate failed: ") + zError(rc));
    }
    out.resize(out.size() - s->avail_out);
    return out;
}

} // namespace AmzStream
