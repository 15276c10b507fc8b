#include <array>

#include "util/bytes.hpp"

namespace bytes
{

static std::array<std::uint32_t, 256> make_table()
{
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; i++)
    {
        std::uint32_t c = i;
        for (int j = 0; j < 8; j++)
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        table[i] = c;
    }
    return table;
}

std::uint32_t crc32(const std::uint8_t *data, std::size_t len)
{
    // function-local static: thread-safe one-time init, chunks are checked from worker threads
    static const std::array<std::uint32_t, 256> table = make_table();

    std::uint32_t c = ~0u;
    for (std::size_t i = 0; i < len; i++)
        c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
    return ~c;
}

}  // namespace bytes
