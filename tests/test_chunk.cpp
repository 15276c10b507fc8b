// tests/test_chunk.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "proto/chunk.hpp"
#include "util/bytes.hpp"

using namespace chunk;

static std::vector<std::uint8_t> abc_payload()
{
    std::string s;
    for (int i = 0; i < 1000; ++i)
        s += "abc";
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

TEST(Crc32, KnownVector)
{
    const std::string s = "123456789";
    EXPECT_EQ(bytes::crc32(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()),
              0xCBF43926u);
    EXPECT_EQ(bytes::crc32(nullptr, 0), 0u);
}

TEST(Chunk, SplitCountsAndLengths)
{
    auto data = abc_payload();  // 3000 bytes
    auto cs   = split(data, 1024);
    ASSERT_EQ(cs.size(), 3u);
    EXPECT_EQ(count(data.size(), 1024), 3u);
    EXPECT_EQ(cs[0].size(), TAG_SIZE + 1024);
    EXPECT_EQ(cs[1].size(), TAG_SIZE + 1024);
    EXPECT_EQ(cs[2].size(), TAG_SIZE + 952);
    for (std::size_t i = 0; i < cs.size(); ++i)
        EXPECT_EQ(cs[i].size(), tagged_length(data.size(), 1024, i));

    // tag is the CRC of the raw slice
    EXPECT_EQ(bytes::get_u32le(cs[1].data()), bytes::crc32(data.data() + 1024, 1024));
}

TEST(Chunk, ExactMultipleAndEmpty)
{
    std::vector<std::uint8_t> data(2048, 0x5A);
    EXPECT_EQ(split(data, 1024).size(), 2u);
    EXPECT_TRUE(split({}, 1024).empty());
    EXPECT_EQ(tagged_length(2048, 1024, 2), 0u);
}

TEST(Chunk, ReassembleRoundtrip)
{
    auto                      data = abc_payload();
    std::vector<std::uint8_t> out;
    framevault::Error         err;
    ASSERT_TRUE(reassemble(split(data, 1000), out, err));
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(out, data);
}

TEST(Chunk, BitFlipReportsChunkIndex)
{
    auto data = abc_payload();
    auto cs   = split(data, 1024);
    cs[1][TAG_SIZE + 10] ^= 0x01;

    std::vector<std::uint8_t> out{1, 2, 3};
    framevault::Error         err;
    EXPECT_FALSE(reassemble(cs, out, err));
    EXPECT_EQ(err.code, framevault::Errc::IntegrityMismatch);
    EXPECT_EQ(err.index, 1);
    EXPECT_EQ(out, (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST(Chunk, TooShortChunkRejected)
{
    std::vector<Chunk> cs{Chunk{0x01, 0x02}};
    std::vector<std::uint8_t> out;
    framevault::Error         err;
    EXPECT_FALSE(reassemble(cs, out, err));
    EXPECT_EQ(err.code, framevault::Errc::IntegrityMismatch);
    EXPECT_EQ(err.index, 0);
}
