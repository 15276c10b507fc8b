#pragma once
#include <cstddef>
#include <cstdint>

#include "util/error.hpp"

namespace config
{

inline constexpr std::uint32_t DEFAULT_WIDTH      = 3840;  // 4K
inline constexpr std::uint32_t DEFAULT_HEIGHT     = 2160;
inline constexpr std::uint32_t DEFAULT_FPS        = 30;
inline constexpr std::size_t   DEFAULT_CHUNK_SIZE = 64 * 1024;
inline constexpr std::size_t   DEFAULT_BLOCK_SIZE = 1024;
inline constexpr double        DEFAULT_REDUNDANCY = 1.3;

// All tunables of one encode/decode run. Passed by value/reference, never global.
struct Config
{
    std::uint32_t width      = DEFAULT_WIDTH;
    std::uint32_t height     = DEFAULT_HEIGHT;
    std::uint32_t fps        = DEFAULT_FPS;
    std::size_t   chunk_size = DEFAULT_CHUNK_SIZE;
    std::size_t   block_size = DEFAULT_BLOCK_SIZE;
    double        redundancy = DEFAULT_REDUNDANCY;
    unsigned      threads    = 1;
};

// Defaults overridden by FRAMEVAULT_* environment variables. Malformed values are logged and
// skipped.
Config from_env();

bool validate(const Config &cfg, framevault::Error &err);

// Byte capacity of one data frame (width * height * 3).
std::size_t frame_capacity(const Config &cfg);

}  // namespace config
