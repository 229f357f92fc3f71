#include <amzstream/core/decoder/stream_decoder.hpp>
#include <amzstream/core/codec/format_error.hpp>
#include <spdlog/spdlog.h>

namespace AmzStream {

namespace {

DecoderOptions normalize(DecoderOptions options) {
    if (options.strict)
        options.codec.strictDecompression = true;
    return options;
}

} // anonymous namespace

StreamDecoder::StreamDecoder(const DecoderOptions& options)
    : options_(normalize(options)), codec_(options_.codec) {
}

void StreamDecoder::feed(const uint8_t* data, size_t len) {
    if (len == 0) return;

    if (len > options_.maxBufferBytes || buffered() > options_.maxBufferBytes - len) {
        stats_.rejected_feeds++;
        spdlog::error("[StreamDecoder] Rejecting {} byte chunk: {} bytes already buffered, limit {}",
                      len, buffered(), options_.maxBufferBytes);
        throw BufferOverflowError("Decoder buffer limit of " +
                                  std::to_string(options_.maxBufferBytes) + " bytes exceeded");
    }

    compact();
    buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<Frame> StreamDecoder::next() {
    while (buffered() >= kMinFrameSize) {
        std::optional<Frame> frame;
        try {
            frame = codec_.extract(buffer_.data(), buffer_.size(), readOffset_);
        } catch (const FormatError& e) {
            stats_.format_errors++;
            if (options_.strict) {
                finishResyncRun();
                spdlog::error("[StreamDecoder] Format error ({}): {}", toString(e.kind()), e.what());
                throw;
            }
            if (resyncRun_ == 0) {
                stats_.resync_runs++;
                resyncFirstError_ = e.what();
            }
            resyncRun_++;
            stats_.resync_bytes_skipped++;
            consume(1);
            continue;
        }

        if (!frame) break;  // Wait for more data

        finishResyncRun();
        consume(frame->consumedBytes);
        stats_.bytes_consumed += frame->consumedBytes;
        stats_.frames_decoded++;

        if (frame->nested) {
            stats_.nested_frames_unwrapped++;
            return std::move(*frame->nested);
        }
        return frame;
    }

    finishResyncRun();
    return std::nullopt;
}

std::vector<Frame> StreamDecoder::decode() {
    std::vector<Frame> frames;
    try {
        while (auto frame = next()) {
            frames.push_back(std::move(*frame));
        }
    } catch (const FormatError&) {
        if (frames.empty()) throw;
        // The bad bytes are still buffered, so the next call raises the error
        spdlog::debug("[StreamDecoder] Returning {} frames decoded before the error", frames.size());
    }
    return frames;
}

void StreamDecoder::reset() {
    if (buffered() > 0)
        spdlog::debug("[StreamDecoder] Reset discarding {} buffered bytes", buffered());
    buffer_.clear();
    readOffset_ = 0;
    resyncRun_ = 0;
    resyncFirstError_.clear();
}

void StreamDecoder::consume(size_t n) {
    readOffset_ += n;
    if (readOffset_ >= buffer_.size()) {
        buffer_.clear();
        readOffset_ = 0;
    }
}

// Consumed bytes are erased only when new data arrives.
void StreamDecoder::compact() {
    if (readOffset_ == 0) return;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(readOffset_));
    readOffset_ = 0;
}

void StreamDecoder::finishResyncRun() {
    if (resyncRun_ == 0) return;
    spdlog::warn("[StreamDecoder] Resynchronized after skipping {} bytes (first error: {})",
                 resyncRun_, resyncFirstError_);
    resyncRun_ = 0;
    resyncFirstError_.clear();
}

} // namespace AmzStream
