#include <algorithm>
#include <cstring>

#include "frame/frame_packer.hpp"
#include "util/bytes.hpp"
#include "util/log.hpp"

namespace frame
{

std::size_t data_capacity(const Geometry &g)
{
    return g.bytes() > CHUNK_INDEX_SIZE ? g.bytes() - CHUNK_INDEX_SIZE : 0;
}

bool pack_data(const Geometry                  &g,
               std::uint32_t                    chunk_index,
               const std::vector<std::uint8_t> &packet,
               Frame                           &out)
{
    if (packet.size() > data_capacity(g))
    {
        LOG_ERROR("pack_data: packet of %zu bytes exceeds frame capacity %zu", packet.size(),
                  data_capacity(g));
        return false;
    }
    out.assign(g.bytes(), 0);
    bytes::put_u32le(out.data(), chunk_index);
    if (!packet.empty())
        std::memcpy(out.data() + CHUNK_INDEX_SIZE, packet.data(), packet.size());
    return true;
}

static void put_pixel(Frame &f, std::size_t pixel, std::uint8_t v)
{
    std::uint8_t *px = f.data() + pixel * CHANNELS;
    px[0]            = v;
    px[1]            = v;
    px[2]            = v;
}

std::size_t metadata_frame_count(const Geometry &g, std::size_t meta_len)
{
    const std::size_t per = g.pixels();
    if (per == 0)
        return 0;
    return (meta_len + per - 1) / per;
}

std::vector<Frame> pack_metadata(const Geometry &g, const std::vector<std::uint8_t> &meta)
{
    std::vector<Frame> frames;
    if (g.pixels() < LENGTH_PREFIX_SIZE)
    {
        LOG_ERROR("pack_metadata: frame too small (%zu pixels)", g.pixels());
        return frames;
    }
    frames.reserve(1 + metadata_frame_count(g, meta.size()));

    Frame        len_frame(g.bytes(), 0);
    std::uint8_t len_le[LENGTH_PREFIX_SIZE];
    bytes::put_u32le(len_le, static_cast<std::uint32_t>(meta.size()));
    for (std::size_t i = 0; i < LENGTH_PREFIX_SIZE; i++)
        put_pixel(len_frame, i, len_le[i]);
    frames.push_back(std::move(len_frame));

    const std::size_t per = g.pixels();
    for (std::size_t off = 0; off < meta.size(); off += per)
    {
        Frame             f(g.bytes(), 0);
        const std::size_t take = std::min(per, meta.size() - off);
        for (std::size_t j = 0; j < take; j++)
            put_pixel(f, j, meta[off + j]);
        frames.push_back(std::move(f));
    }
    return frames;
}

bool read_metadata_length(const Frame &f, std::uint32_t &len)
{
    if (f.size() < LENGTH_PREFIX_SIZE * CHANNELS)
        return false;
    std::uint8_t len_le[LENGTH_PREFIX_SIZE];
    for (std::size_t i = 0; i < LENGTH_PREFIX_SIZE; i++)
        len_le[i] = f[i * CHANNELS];
    len = bytes::get_u32le(len_le);
    return true;
}

std::size_t append_metadata_bytes(const Frame &f, std::size_t want, std::vector<std::uint8_t> &out)
{
    const std::size_t take = std::min(want, f.size() / CHANNELS);
    for (std::size_t j = 0; j < take; j++)
        out.push_back(f[j * CHANNELS]);
    return take;
}

std::vector<std::uint8_t> unpack(const Frame &f)
{
    std::size_t end = f.size();
    while (end > 0 && f[end - 1] == 0)
        end--;
    return std::vector<std::uint8_t>(f.begin(), f.begin() + end);
}

std::optional<DataFrame> unpack_data(const Frame &f)
{
    std::vector<std::uint8_t> flat = unpack(f);
    if (flat.size() <= CHUNK_INDEX_SIZE)
    {
        // a packet always has a non-zero block count, so an empty packet means a blank frame
        LOG_WARN("unpack_data: frame carries no packet");
        return std::nullopt;
    }

    DataFrame d;
    d.chunk_index = bytes::get_u32le(flat.data());
    d.packet.assign(flat.begin() + CHUNK_INDEX_SIZE, flat.end());
    return d;
}

}  // namespace frame
