// ============================================================================
// BENCHMARK: STREAM DECODER THROUGHPUT
// ============================================================================
// Test scenarios:
// 1. Whole-stream feed (one feed, one decode)
// 2. Network-sized chunks (4 KiB feeds, decode after each)
// 3. Byte-at-a-time feeds (worst-case fragmentation)
// 4. Checksum verification overhead
// 5. Gzip payloads
// ============================================================================

#include <iostream>
#include <chrono>
#include <algorithm>
#include <iomanip>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <amzstream/core/codec/frame_encoder.hpp>
#include <amzstream/core/codec/gzip.hpp>
#include <amzstream/core/decoder/stream_decoder.hpp>

using namespace AmzStream;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t frames;
    uint64_t bytes;
    uint64_t elapsed_ns;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    double seconds = r.elapsed_ns / 1e9;
    std::cout << std::left << std::setw(30) << r.name
              << std::right
              << std::setw(10) << r.frames << " frames | "
              << std::setw(8) << std::fixed << std::setprecision(1) << (r.bytes / seconds / (1024 * 1024)) << " MiB/s | "
              << std::setw(8) << std::fixed << std::setprecision(1) << (double)r.elapsed_ns / r.frames << " ns/frame"
              << std::endl;
}

std::vector<uint8_t> build_stream(size_t frames, bool gzip) {
    FrameEncoder encoder;
    std::string body = "{\"content\":\"" + std::string(200, 'x') + "\"}";
    std::vector<uint8_t> payload(body.begin(), body.end());
    if (gzip) payload = gzipCompress(payload);

    HeaderMap headers;
    headers[":message-type"] = std::string("event");
    headers[":event-type"] = std::string("assistantResponseEvent");
    headers[":content-type"] = std::string("application/json");

    std::vector<uint8_t> stream;
    for (size_t i = 0; i < frames; ++i) {
        auto frame = encoder.encode(headers, payload);
        stream.insert(stream.end(), frame.begin(), frame.end());
    }
    return stream;
}

BenchmarkResult benchmark_chunked(const std::string& name, const std::vector<uint8_t>& stream,
                                  size_t chunk_size, const DecoderOptions& options) {
    StreamDecoder decoder(options);
    uint64_t frames = 0;

    auto start = std::chrono::high_resolution_clock::now();

    for (size_t pos = 0; pos < stream.size(); pos += chunk_size) {
        size_t n = std::min(chunk_size, stream.size() - pos);
        decoder.feed(stream.data() + pos, n);
        while (auto frame = decoder.next()) {
            ++frames;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    uint64_t elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    return {name, frames, stream.size(), elapsed_ns};
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "  AMZSTREAM DECODER PERFORMANCE BENCHMARK" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    constexpr size_t FRAMES = 50000;
    auto plain = build_stream(FRAMES, false);
    auto zipped = build_stream(FRAMES / 10, true);
    DecoderOptions lenient;

    print_header("Feed granularity");
    print_result(benchmark_chunked("Whole stream", plain, plain.size(), lenient));
    print_result(benchmark_chunked("4 KiB chunks", plain, 4096, lenient));
    print_result(benchmark_chunked("64 byte chunks", plain, 64, lenient));
    print_result(benchmark_chunked("1 byte chunks", plain, 1, lenient));

    print_header("Checksum verification");
    DecoderOptions verifying;
    verifying.codec.verifyChecksums = true;
    print_result(benchmark_chunked("4 KiB chunks, no verify", plain, 4096, lenient));
    print_result(benchmark_chunked("4 KiB chunks, crc32c", plain, 4096, verifying));

    print_header("Gzip payloads");
    print_result(benchmark_chunked("4 KiB chunks, gzip", zipped, 4096, lenient));

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "All benchmarks completed successfully!" << std::endl;
    std::cout << std::string(70, '=') << "\n" << std::endl;

    return 0;
}
