#include <rpcreflect/compression/gzip.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

RPCREFLECT_NAMESPACE_BEGIN

TEST(Gzip, CompressDecompress) {
    const std::string data = "message Foo { message NestedFoo {} }";
    const auto compressed = compression::Compress(data);
    EXPECT_NE(compressed, data);
    // gzip magic
    ASSERT_GE(compressed.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(compressed[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(compressed[1]), 0x8b);

    EXPECT_EQ(compression::Decompress(compressed), data);
}

TEST(Gzip, Empty) { EXPECT_EQ(compression::Decompress(compression::Compress("")), ""); }

TEST(Gzip, LargerThanChunk) {
    std::string data;
    for (int i = 0; i < 100000; ++i) {
        data += static_cast<char>('a' + i % 26);
        data += static_cast<char>(i % 251);
    }
    EXPECT_EQ(compression::Decompress(compression::Compress(data)), data);
}

TEST(Gzip, NotGzip) {
    EXPECT_THROW(compression::Decompress(std::string_view{"\x00", 1}), compression::DecompressionError);
    EXPECT_THROW(compression::Decompress("plain text is not gzip"), compression::DecompressionError);
    EXPECT_THROW(compression::Decompress(""), compression::DecompressionError);
}

TEST(Gzip, MultipleMembers) {
    EXPECT_EQ(compression::Decompress(compression::Compress("hello") + compression::Compress(" world")), "hello world");
}

TEST(Gzip, TrailingGarbage) {
    EXPECT_THROW(compression::Decompress(compression::Compress("hello") + "garbage"), compression::DecompressionError);
    EXPECT_THROW(compression::Decompress(compression::Compress("hello") + '\x1f'), compression::DecompressionError);
}

TEST(Gzip, Truncated) {
    const auto compressed = compression::Compress("some descriptor bytes that get cut off");
    const auto truncated = std::string_view{compressed}.substr(0, compressed.size() / 2);
    try {
        compression::Decompress(truncated);
        FAIL() << "truncated input must not decompress";
    } catch (const compression::DecompressionError& ex) {
        EXPECT_THAT(ex.what(), testing::HasSubstr("unexpected EOF"));
    }
}

RPCREFLECT_NAMESPACE_END
