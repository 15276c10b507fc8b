#include <algorithm>
#include <cstdint>

#include "proto/chunk.hpp"
#include "util/bytes.hpp"
#include "util/log.hpp"

namespace chunk
{

std::size_t count(std::size_t total, std::size_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    return (total + chunk_size - 1) / chunk_size;
}

std::size_t tagged_length(std::size_t total, std::size_t chunk_size, std::size_t index)
{
    const std::size_t start = index * chunk_size;
    if (chunk_size == 0 || start >= total)
        return 0;
    return TAG_SIZE + std::min(chunk_size, total - start);
}

std::vector<Chunk> split(const std::vector<std::uint8_t> &data, std::size_t chunk_size)
{
    std::vector<Chunk> out;
    if (chunk_size == 0)
    {
        LOG_ERROR("split: invalid chunk_size (0)");
        return out;
    }

    const std::size_t n = count(data.size(), chunk_size);
    out.reserve(n);
    for (std::size_t i = 0; i < n; i++)
    {
        const std::size_t start = i * chunk_size;
        const std::size_t take  = std::min(chunk_size, data.size() - start);

        Chunk c(TAG_SIZE + take);
        bytes::put_u32le(c.data(), bytes::crc32(data.data() + start, take));
        std::copy(data.begin() + start, data.begin() + start + take, c.begin() + TAG_SIZE);
        out.push_back(std::move(c));
    }
    LOG_DEBUG("split %zu bytes into %zu chunks of <= %zu bytes", data.size(), n, chunk_size);
    return out;
}

bool reassemble(const std::vector<Chunk> &chunks,
                std::vector<std::uint8_t> &out,
                framevault::Error         &err)
{
    std::size_t total = 0;
    for (std::size_t i = 0; i < chunks.size(); i++)
    {
        const Chunk &c = chunks[i];
        if (c.size() < TAG_SIZE)
        {
            LOG_ERROR("reassemble: chunk %zu too short (%zu bytes)", i, c.size());
            return framevault::fail(err, framevault::Errc::IntegrityMismatch,
                                    "chunk shorter than its CRC tag", static_cast<std::int64_t>(i));
        }
        const std::uint32_t stored   = bytes::get_u32le(c.data());
        const std::uint32_t computed = bytes::crc32(c.data() + TAG_SIZE, c.size() - TAG_SIZE);
        if (stored != computed)
        {
            LOG_ERROR("reassemble: CRC mismatch in chunk %zu (stored %08x, computed %08x)", i,
                      stored, computed);
            return framevault::fail(err, framevault::Errc::IntegrityMismatch, "CRC32 mismatch",
                                    static_cast<std::int64_t>(i));
        }
        total += c.size() - TAG_SIZE;
    }

    std::vector<std::uint8_t> merged;
    merged.reserve(total);
    for (const auto &c : chunks)
        merged.insert(merged.end(), c.begin() + TAG_SIZE, c.end());
    out.swap(merged);
    return true;
}

}  // namespace chunk
