#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace bytes
{

// explicit little-endian, independent of host byte order
inline void put_u16le(std::uint8_t *out, std::uint16_t v)
{
    out[0] = static_cast<std::uint8_t>(v & 0xFF);
    out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
}

inline void put_u32le(std::uint8_t *out, std::uint32_t v)
{
    out[0] = static_cast<std::uint8_t>(v & 0xFF);
    out[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    out[2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
    out[3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

inline std::uint16_t get_u16le(const std::uint8_t *in)
{
    return static_cast<std::uint16_t>(in[0] | (in[1] << 8));
}

inline std::uint32_t get_u32le(const std::uint8_t *in)
{
    return (std::uint32_t)in[0] | ((std::uint32_t)in[1] << 8) | ((std::uint32_t)in[2] << 16) |
           ((std::uint32_t)in[3] << 24);
}

inline void append_u16le(std::vector<std::uint8_t> &out, std::uint16_t v)
{
    std::uint8_t b[2];
    put_u16le(b, v);
    out.insert(out.end(), b, b + 2);
}

inline void append_u32le(std::vector<std::uint8_t> &out, std::uint32_t v)
{
    std::uint8_t b[4];
    put_u32le(b, v);
    out.insert(out.end(), b, b + 4);
}

// IEEE 802.3 CRC-32 (same values as zlib's crc32)
std::uint32_t crc32(const std::uint8_t *data, std::size_t len);

}  // namespace bytes
