// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <amzstream/core/config/loader.hpp>
#include <amzstream/core/config/app_config.hpp>

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    EXPECT_EQ(config.app_name, "AmzStreamCore");
    EXPECT_EQ(config.version, "1.0.0");
    EXPECT_EQ(config.logging.level, "info");

    // Shipped defaults match the built-in decoder defaults
    AmzStream::DecoderOptions defaults;
    EXPECT_EQ(config.decoder.maxBufferBytes, defaults.maxBufferBytes);
    EXPECT_FALSE(config.decoder.strict);
    EXPECT_FALSE(config.decoder.codec.verifyChecksums);
    EXPECT_EQ(config.decoder.codec.maxNestingDepth, 8u);
    EXPECT_EQ(config.decoder.codec.checksumAlgorithm, AmzStream::ChecksumAlgorithm::Crc32c);
    EXPECT_EQ(config.dump.chunk_size, 4096u);
}

TEST(ConfigLoader, LoadStrictConfiguration) {
    auto config = ConfigLoader::loadConfig("unittest/validConfig/strict_checksums.yaml");

    EXPECT_EQ(config.version, "2.1.0");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_TRUE(config.decoder.strict);
    EXPECT_TRUE(config.decoder.codec.verifyChecksums);
    EXPECT_EQ(config.decoder.codec.checksumAlgorithm, AmzStream::ChecksumAlgorithm::Crc32);
    EXPECT_EQ(config.decoder.codec.maxNestingDepth, 2u);
    EXPECT_EQ(config.dump.chunk_size, 1u);

    // Fields left out keep their defaults
    EXPECT_EQ(config.decoder.maxBufferBytes, AmzStream::DecoderOptions{}.maxBufferBytes);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnUnknownChecksumAlgorithm) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/unknown_checksum.yaml"),
        std::runtime_error
    );
}
