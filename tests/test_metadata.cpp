// tests/test_metadata.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "proto/metadata.hpp"
#include "util/bytes.hpp"

using namespace meta;

static std::vector<std::uint8_t> wire_of(const std::string &text)
{
    std::vector<std::uint8_t> out;
    bytes::append_u32le(out, static_cast<std::uint32_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

static const char *GOOD = "version=1.0.0\n"
                          "filename=a.bin\n"
                          "file_size=3000\n"
                          "chunk_size=1024\n"
                          "num_chunks=3\n"
                          "encrypted=false\n"
                          "timestamp=2024-05-01T12:00:00Z\n";

TEST(Metadata, CreateComputesChunks)
{
    Metadata m = create("a.bin", 3000, 1024, true);
    EXPECT_EQ(m.version, FORMAT_VERSION);
    EXPECT_EQ(m.num_chunks, 3u);
    EXPECT_TRUE(m.encrypted);
    ASSERT_EQ(m.timestamp.size(), 20u);
    EXPECT_EQ(m.timestamp.back(), 'Z');
    EXPECT_EQ(m.timestamp[10], 'T');

    EXPECT_EQ(create("e", 0, 1024, false).num_chunks, 0u);
}

TEST(Metadata, SerializeIsStable)
{
    Metadata m = create("report.pdf", 70000, 65536, false);
    m.timestamp = "2024-05-01T12:00:00Z";
    ASSERT_TRUE(m.set_extra("block_size", "1024"));
    ASSERT_TRUE(m.set_extra("author", "x"));

    auto              w1 = serialize(m);
    const std::string text(w1.begin() + 4, w1.end());
    EXPECT_EQ(text, "version=1.0.0\nfilename=report.pdf\nfile_size=70000\nchunk_size=65536\n"
                    "num_chunks=2\nencrypted=false\ntimestamp=2024-05-01T12:00:00Z\n"
                    "block_size=1024\nauthor=x\n");

    Metadata          back;
    framevault::Error err;
    ASSERT_TRUE(deserialize(w1.data(), w1.size(), back, err));
    EXPECT_EQ(serialize(back), w1);
    ASSERT_NE(back.find_extra("author"), nullptr);
    EXPECT_EQ(*back.find_extra("author"), "x");
    EXPECT_EQ(back.find_extra("missing"), nullptr);
}

TEST(Metadata, EscapedValues)
{
    Metadata m  = create("odd\nname\\with\rstuff", 1, 1, false);
    m.timestamp = "t";
    auto              w = serialize(m);
    Metadata          back;
    framevault::Error err;
    ASSERT_TRUE(deserialize(w.data(), w.size(), back, err));
    EXPECT_EQ(back.filename, m.filename);
}

TEST(Metadata, SetExtraRejectsReservedAndInvalidKeys)
{
    Metadata m;
    EXPECT_FALSE(m.set_extra("filename", "x"));
    EXPECT_FALSE(m.set_extra("bad key", "x"));
    EXPECT_FALSE(m.set_extra("", "x"));
    EXPECT_TRUE(m.set_extra("k", "1"));
    EXPECT_TRUE(m.set_extra("k", "2"));
    ASSERT_EQ(m.extra.size(), 1u);
    EXPECT_EQ(m.extra[0].second, "2");
}

TEST(Metadata, DeserializeGood)
{
    auto              w = wire_of(GOOD);
    Metadata          m;
    framevault::Error err;
    ASSERT_TRUE(deserialize(w.data(), w.size(), m, err));
    EXPECT_EQ(m.filename, "a.bin");
    EXPECT_EQ(m.file_size, 3000u);
    EXPECT_EQ(m.num_chunks, 3u);
    EXPECT_FALSE(m.encrypted);
}

static framevault::Errc parse_error(const std::string &text)
{
    auto              w = wire_of(text);
    Metadata          m;
    framevault::Error err;
    EXPECT_FALSE(deserialize(w.data(), w.size(), m, err)) << text;
    return err.code;
}

TEST(Metadata, CorruptInputs)
{
    const std::string good = GOOD;
    using framevault::Errc;

    // missing required field
    std::string no_ts = good.substr(0, good.find("timestamp="));
    EXPECT_EQ(parse_error(no_ts), Errc::MetadataCorrupt);

    // inconsistent chunk count
    std::string bad_count = good;
    bad_count.replace(bad_count.find("num_chunks=3"), 12, "num_chunks=4");
    EXPECT_EQ(parse_error(bad_count), Errc::MetadataCorrupt);

    EXPECT_EQ(parse_error(good + "extra_without_newline=1"), Errc::MetadataCorrupt);
    EXPECT_EQ(parse_error(good + "noequals\n"), Errc::MetadataCorrupt);
    EXPECT_EQ(parse_error(good + "filename=dup\n"), Errc::MetadataCorrupt);
    EXPECT_EQ(parse_error(good + "x=bad\\q\n"), Errc::MetadataCorrupt);

    std::string bad_bool = good;
    bad_bool.replace(bad_bool.find("encrypted=false"), 15, "encrypted=maybe");
    EXPECT_EQ(parse_error(bad_bool), Errc::MetadataCorrupt);

    std::string zero_cs = good;
    zero_cs.replace(zero_cs.find("chunk_size=1024"), 15, "chunk_size=0");
    EXPECT_EQ(parse_error(zero_cs), Errc::MetadataCorrupt);
}

TEST(Metadata, BadLengthPrefix)
{
    auto w = wire_of(GOOD);
    bytes::put_u32le(w.data(), static_cast<std::uint32_t>(w.size()));  // claims more than present
    Metadata          m;
    framevault::Error err;
    EXPECT_FALSE(deserialize(w.data(), w.size(), m, err));
    EXPECT_EQ(err.code, framevault::Errc::MetadataCorrupt);

    EXPECT_FALSE(deserialize(w.data(), 3, m, err));
}
