#pragma once

#include <amzstream/core/decoder/stream_decoder.hpp>
#include <cstddef>
#include <string>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct DumpConfig {
    size_t chunk_size = 4096;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    AmzStream::DecoderOptions decoder;
    DumpConfig dump;
};

} // namespace AppConfig
