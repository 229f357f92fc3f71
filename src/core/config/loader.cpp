#include <amzstream/core/config/loader.hpp>
#include <amzstream/core/codec/frame.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace {

constexpr uint32_t kMaxNestingDepthLimit = 64;

template <typename T>
T requiredField(const YAML::Node& node, const std::string& key) {
    try {
        if (!node[key]) {
            throw std::runtime_error("Missing required config field: " + key);
        }
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid type for config field '" + key + "': " + e.what());
    }
}

template <typename T>
T optionalField(const YAML::Node& node, const std::string& key, const T& fallback) {
    if (!node) return fallback;
    try {
        if (!node[key]) return fallback;
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid type for config field '" + key + "': " + e.what());
    }
}

void checkLevel(const std::string& level) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* l : kLevels) {
        if (level == l) return;
    }
    throw std::runtime_error("Invalid logging.level: " + level);
}

void loadDecoder(const YAML::Node& node, AmzStream::DecoderOptions& decoder) {
    decoder.maxBufferBytes = optionalField<size_t>(node, "max_buffer_bytes", decoder.maxBufferBytes);
    decoder.strict = optionalField<bool>(node, "strict", decoder.strict);

    auto& codec = decoder.codec;
    codec.verifyChecksums = optionalField<bool>(node, "verify_checksums", codec.verifyChecksums);
    codec.maxNestingDepth = optionalField<uint32_t>(node, "max_nesting_depth", codec.maxNestingDepth);
    codec.maxDecompressedBytes = optionalField<size_t>(node, "max_decompressed_bytes", codec.maxDecompressedBytes);

    std::string algorithm = optionalField<std::string>(node, "checksum_algorithm",
                                                  AmzStream::toString(codec.checksumAlgorithm));
    try {
        codec.checksumAlgorithm = AmzStream::checksumAlgorithmFromString(algorithm);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid decoder.checksum_algorithm: ") + e.what());
    }

    if (decoder.maxBufferBytes < AmzStream::kMaxFrameSize) {
        throw std::runtime_error("decoder.max_buffer_bytes must be at least " +
                                 std::to_string(AmzStream::kMaxFrameSize));
    }
    if (codec.maxNestingDepth == 0 || codec.maxNestingDepth > kMaxNestingDepthLimit) {
        throw std::runtime_error("decoder.max_nesting_depth must be in [1, " +
                                 std::to_string(kMaxNestingDepthLimit) + "]");
    }
    if (codec.maxDecompressedBytes == 0) {
        throw std::runtime_error("decoder.max_decompressed_bytes must be positive");
    }
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + filepath + ": " + e.what());
    }

    const YAML::Node& root = loaded;
    AppConfig::AppConfiguration config;
    config.app_name = requiredField<std::string>(root, "app_name");
    config.version = requiredField<std::string>(root, "version");

    const YAML::Node logging = root["logging"];
    config.logging.level = optionalField<std::string>(logging, "level", config.logging.level);
    config.logging.pattern = optionalField<std::string>(logging, "pattern", config.logging.pattern);
    checkLevel(config.logging.level);

    loadDecoder(root["decoder"], config.decoder);

    config.dump.chunk_size = optionalField<size_t>(root["dump"], "chunk_size", config.dump.chunk_size);
    if (config.dump.chunk_size == 0) {
        throw std::runtime_error("dump.chunk_size must be positive");
    }

    spdlog::debug("[ConfigLoader] Loaded {} (strict={}, verify_checksums={}, max_nesting_depth={})",
                  filepath, config.decoder.strict, config.decoder.codec.verifyChecksums,
                  config.decoder.codec.maxNestingDepth);
    return config;
}
