#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <amzstream/core/config/loader.hpp>
#include <amzstream/core/codec/format_error.hpp>
#include <amzstream/core/decoder/stream_decoder.hpp>
#include <amzstream/core/events/event_mapper.hpp>

// ============================================================================
// amzstream_dump: replay a captured event stream through the decoder
//
//   amzstream_dump <capture-file|-> [config.yaml]
//
// Events go to stdout as JSON lines; logs go to stderr.
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    spdlog::info("Signal {} received, stopping after current chunk...", signum);
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_default_logger(spdlog::stderr_color_mt("amzstream"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

static void applyLoggingConfig(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 2) ? argv[2] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

static void logStats(const AmzStream::StreamDecoder& decoder, uint64_t eventsPrinted) {
    const auto& s = decoder.stats();
    spdlog::info("Frames decoded: {} (nested unwrapped: {}), events printed: {}",
                 s.frames_decoded, s.nested_frames_unwrapped, eventsPrinted);
    spdlog::info("Bytes consumed: {}, resync bytes skipped: {} in {} runs, trailing bytes: {}",
                 s.bytes_consumed, s.resync_bytes_skipped, s.resync_runs, decoder.buffered());
    spdlog::info("Format errors: {}, rejected feeds: {}", s.format_errors, s.rejected_feeds);
}

// ============================================================================
// Replay
// ============================================================================

static void logFrame(const AmzStream::Frame& frame) {
    if (!spdlog::default_logger()->should_log(spdlog::level::debug)) return;
    spdlog::debug("Frame: {} bytes on the wire, {} byte payload{}", frame.consumedBytes,
                  frame.payloadSize(), frame.decompressed ? " (inflated)" : "");
    for (const auto& [name, value] : frame.headers)
        spdlog::debug("  {} = {}", name, AmzStream::toString(value));
}

static uint64_t drain(AmzStream::StreamDecoder& decoder) {
    uint64_t printed = 0;
    // Repeat until empty: strict mode raises a pending error on the next call
    for (auto frames = decoder.decode(); !frames.empty(); frames = decoder.decode()) {
        for (const auto& frame : frames) {
            logFrame(frame);
            std::cout << AmzStream::toJsonLine(AmzStream::toEvent(frame)) << '\n';
            ++printed;
        }
    }
    return printed;
}

static uint64_t replay(std::istream& in, AmzStream::StreamDecoder& decoder, size_t chunkSize) {
    std::vector<uint8_t> chunk(chunkSize);
    uint64_t printed = 0;

    while (g_running.load(std::memory_order_acquire) && in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        decoder.feed(chunk.data(), static_cast<size_t>(got));
        printed += drain(decoder);
    }
    std::cout.flush();

    if (in.bad())
        throw std::runtime_error("Read error on capture input");
    return printed;
}

int main(int argc, char* argv[]) {
    setupLogging();

    if (argc < 2) {
        spdlog::error("Usage: {} <capture-file|-> [config.yaml]", argv[0]);
        return EXIT_FAILURE;
    }

    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        applyLoggingConfig(config.logging);
        spdlog::info("{} v{} starting", config.app_name, config.version);

        AmzStream::StreamDecoder decoder(config.decoder);
        const std::string source = argv[1];
        uint64_t printed = 0;

        if (source == "-") {
            spdlog::info("Reading event stream from stdin ({} byte chunks)", config.dump.chunk_size);
            printed = replay(std::cin, decoder, config.dump.chunk_size);
        } else {
            std::ifstream file(source, std::ios::binary);
            if (!file) {
                spdlog::error("Cannot open capture file: {}", source);
                return EXIT_FAILURE;
            }
            spdlog::info("Replaying {} ({} byte chunks)", source, config.dump.chunk_size);
            printed = replay(file, decoder, config.dump.chunk_size);
        }

        logStats(decoder, printed);
        if (decoder.buffered() > 0)
            spdlog::warn("Stream ended with {} bytes of an incomplete frame", decoder.buffered());

    } catch (const AmzStream::FormatError& e) {
        spdlog::error("Strict decoding failed ({}): {}", AmzStream::toString(e.kind()), e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
