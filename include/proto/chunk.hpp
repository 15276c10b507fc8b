#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "util/error.hpp"

/*
encode:  payload -> split(payload, chunk_size) -> [CRC32 LE (4B)][raw slice] per chunk
decode:  decoded chunks (trimmed to tagged_length) -> reassemble() -> payload
*/

namespace chunk
{

inline constexpr std::size_t TAG_SIZE = 4;

// Wire form of one chunk: CRC32(raw) little-endian followed by the raw slice.
using Chunk = std::vector<std::uint8_t>;

// Number of chunks `total` payload bytes split into (0 for an empty payload).
std::size_t count(std::size_t total, std::size_t chunk_size);

// Wire length (tag included) of chunk `index`.
std::size_t tagged_length(std::size_t total, std::size_t chunk_size, std::size_t index);

std::vector<Chunk> split(const std::vector<std::uint8_t> &data, std::size_t chunk_size);

// Verifies every chunk's CRC and concatenates the raw slices into `out`.
// On mismatch fails with IntegrityMismatch naming the chunk; `out` is left untouched.
bool reassemble(const std::vector<Chunk> &chunks,
                std::vector<std::uint8_t> &out,
                framevault::Error         &err);

}  // namespace chunk
