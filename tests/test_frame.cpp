// tests/test_frame.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>
#include "frame/frame_packer.hpp"

using namespace frame;

TEST(Frame, GeometryAndCapacity)
{
    Geometry g{8, 4};
    EXPECT_EQ(g.pixels(), 32u);
    EXPECT_EQ(g.bytes(), 96u);
    EXPECT_EQ(data_capacity(g), 92u);
    EXPECT_TRUE((g == Geometry{8, 4}));
    EXPECT_TRUE((g != Geometry{4, 8}));
}

TEST(Frame, DataPackUnpack)
{
    Geometry                  g{8, 4};
    std::vector<std::uint8_t> packet = {9, 0, 0, 0, 1, 0, 2, 0, 0x11, 0x22, 0x33};

    Frame f;
    ASSERT_TRUE(pack_data(g, 0x0A0B0C0D, packet, f));
    EXPECT_EQ(f.size(), g.bytes());
    EXPECT_EQ(f[0], 0x0D);
    EXPECT_EQ(f[3], 0x0A);

    auto d = unpack_data(f);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->chunk_index, 0x0A0B0C0Du);
    EXPECT_EQ(d->packet, packet);
}

TEST(Frame, PacketTooLargeRejected)
{
    Geometry                  g{2, 2};  // 12 bytes, 8 for the packet
    std::vector<std::uint8_t> packet(9, 1);
    Frame                     f;
    EXPECT_FALSE(pack_data(g, 0, packet, f));
    packet.resize(8);
    EXPECT_TRUE(pack_data(g, 0, packet, f));
}

TEST(Frame, UnpackTrimsTrailingZeros)
{
    Geometry                  g{4, 4};
    std::vector<std::uint8_t> packet = {5, 6, 0, 7, 0, 0};
    Frame                     f;
    ASSERT_TRUE(pack_data(g, 1, packet, f));

    auto flat = unpack(f);
    ASSERT_EQ(flat.size(), 4u + 4u);
    auto d = unpack_data(f);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->packet, (std::vector<std::uint8_t>{5, 6, 0, 7}));
}

TEST(Frame, BlankFrameHasNoPacket)
{
    Frame blank(Geometry{4, 4}.bytes(), 0);
    EXPECT_TRUE(unpack(blank).empty());
    EXPECT_FALSE(unpack_data(blank).has_value());
}

TEST(Frame, MetadataFrames)
{
    Geometry                  g{3, 2};  // 6 bytes per metadata frame
    std::vector<std::uint8_t> meta;
    for (int i = 0; i < 15; ++i)
        meta.push_back(static_cast<std::uint8_t>(0x40 + i));

    auto frames = pack_metadata(g, meta);
    ASSERT_EQ(frames.size(), 1u + 3u);
    EXPECT_EQ(metadata_frame_count(g, meta.size()), 3u);

    // replicated across the three channels
    EXPECT_EQ(frames[1][0], 0x40);
    EXPECT_EQ(frames[1][1], 0x40);
    EXPECT_EQ(frames[1][2], 0x40);

    std::uint32_t len = 0;
    ASSERT_TRUE(read_metadata_length(frames[0], len));
    EXPECT_EQ(len, 15u);

    std::vector<std::uint8_t> back;
    for (std::size_t i = 1; i < frames.size(); ++i)
        append_metadata_bytes(frames[i], len - back.size(), back);
    EXPECT_EQ(back, meta);
}

TEST(Frame, MetadataNeedsFourPixels)
{
    EXPECT_TRUE(pack_metadata(Geometry{3, 1}, {1, 2, 3}).empty());
    std::uint32_t len = 0;
    EXPECT_FALSE(read_metadata_length(Frame(6, 0), len));
}
