// ============================================================================
// GZIP UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <amzstream/core/codec/gzip.hpp>
#include "test_helpers.hpp"

using namespace AmzStream;
using AmzStreamTest::bytesOf;
using AmzStreamTest::concat;

TEST(Gzip, MagicDetection) {
    std::vector<uint8_t> magic = {0x1F, 0x8B, 0x08};
    std::vector<uint8_t> plain = {'{', '}'};
    EXPECT_TRUE(hasGzipMagic(magic.data(), magic.size()));
    EXPECT_FALSE(hasGzipMagic(plain.data(), plain.size()));
    EXPECT_FALSE(hasGzipMagic(magic.data(), 1));
}

TEST(Gzip, CompressThenInflate) {
    auto plain = bytesOf("{\"content\":\"streamed text\"}");
    auto packed = gzipCompress(plain);
    EXPECT_TRUE(hasGzipMagic(packed.data(), packed.size()));
    EXPECT_EQ(gunzip(packed.data(), packed.size(), 1024), plain);
}

TEST(Gzip, ConcatenatedMembers) {
    auto packed = concat(gzipCompress(bytesOf("first,")), gzipCompress(bytesOf("second")));
    EXPECT_EQ(gunzip(packed.data(), packed.size(), 1024), bytesOf("first,second"));
}

TEST(Gzip, TruncatedStreamThrows) {
    auto packed = gzipCompress(bytesOf("this will be cut short"));
    packed.resize(packed.size() / 2);
    EXPECT_THROW(gunzip(packed.data(), packed.size(), 1024), GzipError);
}

TEST(Gzip, TrailingGarbageThrows) {
    auto packed = gzipCompress(bytesOf("ok"));
    packed.push_back(0x00);
    packed.push_back(0x42);
    EXPECT_THROW(gunzip(packed.data(), packed.size(), 1024), GzipError);
}

TEST(Gzip, TrailingZeroPaddingIgnored) {
    auto packed = gzipCompress(bytesOf("padded"));
    packed.resize(packed.size() + 8, 0x00);
    EXPECT_EQ(gunzip(packed.data(), packed.size(), 1024), bytesOf("padded"));

    auto twoMembers = concat(gzipCompress(bytesOf("a")), gzipCompress(bytesOf("b")));
    twoMembers.push_back(0x00);
    EXPECT_EQ(gunzip(twoMembers.data(), twoMembers.size(), 1024), bytesOf("ab"));
}

TEST(Gzip, OutputLimitEnforced) {
    std::vector<uint8_t> plain(10000, 'a');
    auto packed = gzipCompress(plain);
    EXPECT_THROW(gunzip(packed.data(), packed.size(), 9999), GzipError);
    EXPECT_EQ(gunzip(packed.data(), packed.size(), 10000).size(), 10000u);
}
