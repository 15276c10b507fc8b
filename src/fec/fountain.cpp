#include <algorithm>
#include <cmath>
#include <cstring>

#include "fec/fountain.hpp"
#include "util/bytes.hpp"
#include "util/log.hpp"

namespace fountain
{

namespace
{
// splitmix64: tiny, portable, and identical on every platform/stdlib
struct SplitMix64
{
    std::uint64_t state;

    std::uint64_t next()
    {
        std::uint64_t z = (state += 0x9e3779b97f4a7c15ull);
        z               = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
        z               = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
        return z ^ (z >> 31);
    }

    // uniform in [0, n); modulo bias is below 2^-40 for the n used here
    std::uint64_t below(std::uint64_t n) { return next() % n; }
};

void xor_into(std::vector<std::uint8_t> &dst, const std::vector<std::uint8_t> &src)
{
    const std::size_t n = std::min(dst.size(), src.size());
    for (std::size_t j = 0; j < n; j++)
        dst[j] ^= src[j];
}
}  // namespace

std::size_t block_count(std::size_t data_len, std::size_t block_size)
{
    if (block_size == 0)
        return 0;
    return (data_len + block_size - 1) / block_size;
}

std::size_t packet_count(std::size_t num_blocks, double redundancy)
{
    if (num_blocks == 0)
        return 0;
    // tolerance keeps e.g. 10 * 1.1 = 11.000000000000002 at 11
    const double      want = std::ceil(static_cast<double>(num_blocks) * redundancy - 1e-9);
    const std::size_t n    = want > 0 ? static_cast<std::size_t>(want) : 0;
    return std::max(n, num_blocks);
}

std::vector<std::uint16_t> select_blocks(std::uint32_t packet_id,
                                         std::size_t   num_blocks,
                                         std::size_t   max_degree)
{
    std::vector<std::uint16_t> sel;
    if (num_blocks == 0)
        return sel;
    if (packet_id < num_blocks)
    {
        sel.push_back(static_cast<std::uint16_t>(packet_id));
        return sel;
    }

    const std::size_t md = std::max<std::size_t>(1, std::min(max_degree, num_blocks));
    SplitMix64        rng{(static_cast<std::uint64_t>(packet_id) << 32) ^
                   (static_cast<std::uint64_t>(num_blocks) << 4) ^ md};

    const std::size_t degree = 1 + static_cast<std::size_t>(rng.below(md));
    sel.reserve(degree);
    // repair packet j always covers block j mod num_blocks, so num_blocks repairs cover every block
    sel.push_back(static_cast<std::uint16_t>((packet_id - num_blocks) % num_blocks));
    while (sel.size() < degree)
    {
        const auto idx = static_cast<std::uint16_t>(rng.below(num_blocks));
        if (std::find(sel.begin(), sel.end(), idx) == sel.end())
            sel.push_back(idx);
    }
    std::sort(sel.begin(), sel.end());
    return sel;
}

std::vector<std::uint8_t> serialize(const Packet &p)
{
    std::vector<std::uint8_t> out;
    out.reserve(HDR_FIXED + 2 * p.hdr.blocks.size() + p.payload.size());
    bytes::append_u32le(out, p.hdr.packet_id);
    bytes::append_u16le(out, static_cast<std::uint16_t>(p.hdr.blocks.size()));
    for (std::uint16_t idx : p.hdr.blocks)
        bytes::append_u16le(out, idx);
    out.insert(out.end(), p.payload.begin(), p.payload.end());
    return out;
}

std::optional<Packet> parse(const std::uint8_t *data, std::size_t len, std::size_t block_size)
{
    // frame unpacking strips trailing zeros, so reads past `len` yield zero
    auto at = [&](std::size_t i) -> std::uint8_t { return i < len ? data[i] : 0; };
    auto u16 = [&](std::size_t i) -> std::uint16_t {
        return static_cast<std::uint16_t>(at(i) | (at(i + 1) << 8));
    };

    Packet p;
    p.hdr.packet_id = (std::uint32_t)at(0) | ((std::uint32_t)at(1) << 8) |
                      ((std::uint32_t)at(2) << 16) | ((std::uint32_t)at(3) << 24);
    const std::uint16_t n = u16(4);
    if (n == 0)
    {
        LOG_WARN("parse: packet %u has no block indices", p.hdr.packet_id);
        return std::nullopt;
    }

    const std::size_t hdr_len = HDR_FIXED + 2 * static_cast<std::size_t>(n);
    if (len > hdr_len + block_size)
    {
        LOG_WARN("parse: packet %u longer than expected (%zu > %zu)", p.hdr.packet_id, len,
                 hdr_len + block_size);
        return std::nullopt;
    }

    p.hdr.blocks.reserve(n);
    for (std::size_t i = 0; i < n; i++)
    {
        const std::uint16_t idx = u16(HDR_FIXED + 2 * i);
        if (!p.hdr.blocks.empty() && idx <= p.hdr.blocks.back())
        {
            LOG_WARN("parse: packet %u block indices not strictly ascending", p.hdr.packet_id);
            return std::nullopt;
        }
        p.hdr.blocks.push_back(idx);
    }

    p.payload.assign(block_size, 0);
    if (len > hdr_len)
        std::memcpy(p.payload.data(), data + hdr_len, len - hdr_len);
    return p;
}

Encoder::Encoder(const std::vector<std::uint8_t> &data, std::size_t block_size, double redundancy)
    : block_size_(block_size)
{
    if (block_size_ == 0)
    {
        LOG_ERROR("Encoder: invalid block_size (0)");
        return;
    }
    const std::size_t n = block_count(data.size(), block_size_);
    blocks_.reserve(n);
    for (std::size_t i = 0; i < n; i++)
    {
        const std::size_t start = i * block_size_;
        const std::size_t take  = std::min(block_size_, data.size() - start);
        std::vector<std::uint8_t> b(block_size_, 0);  // only the final block is ever short
        std::memcpy(b.data(), data.data() + start, take);
        blocks_.push_back(std::move(b));
    }
    num_packets_ = packet_count(n, redundancy);
}

Packet Encoder::packet(std::uint32_t packet_id) const
{
    Packet p;
    p.hdr.packet_id = packet_id;
    p.hdr.blocks    = select_blocks(packet_id, blocks_.size(), std::min(MAX_DEGREE, blocks_.size()));
    if (p.hdr.blocks.empty())
        return p;

    p.payload = blocks_[p.hdr.blocks[0]];
    for (std::size_t i = 1; i < p.hdr.blocks.size(); i++)
        xor_into(p.payload, blocks_[p.hdr.blocks[i]]);
    return p;
}

std::vector<std::vector<std::uint8_t>> Encoder::encode() const
{
    std::vector<std::vector<std::uint8_t>> out;
    out.reserve(num_packets_);
    for (std::size_t id = 0; id < num_packets_; id++)
        out.push_back(serialize(packet(static_cast<std::uint32_t>(id))));
    return out;
}

Decoder::Decoder(std::size_t block_size, std::size_t num_blocks)
    : block_size_(block_size), num_blocks_(num_blocks)
{
}

bool Decoder::add_packet(const std::vector<std::uint8_t> &bytes)
{
    auto p = parse(bytes.data(), bytes.size(), block_size_);
    if (!p)
        return false;
    return add(std::move(*p));
}

bool Decoder::add(Packet p)
{
    if (p.hdr.blocks.empty() || p.payload.size() != block_size_)
    {
        LOG_WARN("Decoder::add: malformed packet %u", p.hdr.packet_id);
        return false;
    }
    for (std::size_t i = 0; i < p.hdr.blocks.size(); i++)
    {
        const std::uint16_t idx = p.hdr.blocks[i];
        if (idx >= num_blocks_ || (i > 0 && idx <= p.hdr.blocks[i - 1]))
        {
            LOG_WARN("Decoder::add: packet %u has bad block index %u (num_blocks=%zu)",
                     p.hdr.packet_id, static_cast<unsigned>(idx), num_blocks_);
            return false;
        }
    }
    packets_.push_back(std::move(p));
    return true;
}

std::optional<std::vector<std::uint8_t>> Decoder::decode()
{
    std::vector<std::vector<std::uint8_t>> known(num_blocks_);
    std::vector<bool>                      have(num_blocks_, false);
    resolved_ = 0;

    for (const auto &p : packets_)
    {
        if (p.hdr.blocks.size() == 1 && !have[p.hdr.blocks[0]])
        {
            known[p.hdr.blocks[0]] = p.payload;
            have[p.hdr.blocks[0]]  = true;
            resolved_++;
        }
    }

    // every productive pass resolves at least one block, so num_blocks + 1 passes always suffice
    const std::size_t max_passes = num_blocks_ + 1;
    std::size_t       passes     = 0;
    bool              progress   = true;
    while (progress && resolved_ < num_blocks_ && passes < max_passes)
    {
        progress = false;
        passes++;
        for (const auto &p : packets_)
        {
            std::size_t unknown = 0;
            std::size_t target  = 0;
            for (std::uint16_t idx : p.hdr.blocks)
            {
                if (!have[idx])
                {
                    unknown++;
                    target = idx;
                }
            }
            if (unknown != 1)
                continue;

            std::vector<std::uint8_t> buf = p.payload;
            for (std::uint16_t idx : p.hdr.blocks)
            {
                if (idx != target)
                    xor_into(buf, known[idx]);
            }
            known[target] = std::move(buf);
            have[target]  = true;
            resolved_++;
            progress = true;
        }
    }

    if (resolved_ < num_blocks_)
    {
        LOG_DEBUG("decode: resolved %zu/%zu blocks from %zu packets after %zu passes", resolved_,
                  num_blocks_, packets_.size(), passes);
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    out.reserve(num_blocks_ * block_size_);
    for (const auto &b : known)
        out.insert(out.end(), b.begin(), b.end());
    return out;
}

}  // namespace fountain
