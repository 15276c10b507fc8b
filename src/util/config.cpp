#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "fec/fountain.hpp"
#include "frame/frame_packer.hpp"
#include "proto/chunk.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

static bool env_u64(const char *key, unsigned long long &out, unsigned long long max = ULLONG_MAX)
{
    const char *v = std::getenv(key);
    if (!v || !*v)
        return false;
    errno       = 0;
    char *end   = nullptr;
    auto  parsed = std::strtoull(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || v[0] == '-')
    {
        LOG_WARN("ignoring %s=%s (not an unsigned integer)", key, v);
        return false;
    }
    if (parsed > max)
    {
        LOG_WARN("ignoring %s=%s (out of range, max %llu)", key, v, max);
        return false;
    }
    out = parsed;
    return true;
}

static bool env_double(const char *key, double &out)
{
    const char *v = std::getenv(key);
    if (!v || !*v)
        return false;
    errno         = 0;
    char  *end    = nullptr;
    double parsed = std::strtod(v, &end);
    if (errno != 0 || end == v || *end != '\0' || !std::isfinite(parsed))
    {
        LOG_WARN("ignoring %s=%s (not a number)", key, v);
        return false;
    }
    out = parsed;
    return true;
}

Config from_env()
{
    Config             cfg;
    unsigned long long u = 0;
    double             d = 0;

    if (env_u64("FRAMEVAULT_WIDTH", u, UINT32_MAX))
        cfg.width = static_cast<std::uint32_t>(u);
    if (env_u64("FRAMEVAULT_HEIGHT", u, UINT32_MAX))
        cfg.height = static_cast<std::uint32_t>(u);
    if (env_u64("FRAMEVAULT_FPS", u, UINT32_MAX))
        cfg.fps = static_cast<std::uint32_t>(u);
    if (env_u64("FRAMEVAULT_CHUNK_SIZE", u, SIZE_MAX))
        cfg.chunk_size = static_cast<std::size_t>(u);
    if (env_u64("FRAMEVAULT_BLOCK_SIZE", u, SIZE_MAX))
        cfg.block_size = static_cast<std::size_t>(u);
    if (env_double("FRAMEVAULT_REDUNDANCY", d))
        cfg.redundancy = d;
    if (env_u64("FRAMEVAULT_THREADS", u, UINT_MAX))
        cfg.threads = static_cast<unsigned>(u);
    return cfg;
}

std::size_t frame_capacity(const Config &cfg)
{
    return static_cast<std::size_t>(cfg.width) * cfg.height * 3;
}

bool validate(const Config &cfg, framevault::Error &err)
{
    using framevault::Errc;
    using framevault::fail;

    if (cfg.width == 0 || cfg.height == 0)
        return fail(err, Errc::BadConfig, "frame width and height must be non-zero");
    if (static_cast<std::size_t>(cfg.width) * cfg.height < frame::LENGTH_PREFIX_SIZE)
        return fail(err, Errc::BadConfig, "frame must have at least 4 pixels");
    if (cfg.fps == 0)
        return fail(err, Errc::BadConfig, "fps must be non-zero");
    if (cfg.chunk_size == 0)
        return fail(err, Errc::BadConfig, "chunk_size must be non-zero");
    if (cfg.block_size == 0 || cfg.block_size > UINT16_MAX)
        return fail(err, Errc::BadConfig,
                    "block_size must be in [1, 65535], got " + std::to_string(cfg.block_size));
    if (!std::isfinite(cfg.redundancy) || cfg.redundancy < 1.0)
        return fail(err, Errc::BadConfig,
                    "redundancy must be >= 1.0, got " + std::to_string(cfg.redundancy));
    if (cfg.threads == 0)
        return fail(err, Errc::BadConfig, "threads must be >= 1");

    const std::size_t need = frame::CHUNK_INDEX_SIZE + fountain::MAX_HDR_SIZE + cfg.block_size;
    if (frame_capacity(cfg) < need)
    {
        return fail(err, Errc::BadConfig,
                    "frame capacity " + std::to_string(frame_capacity(cfg)) +
                        " bytes is below the " + std::to_string(need) +
                        " bytes one data packet needs");
    }
    const std::size_t blocks =
        fountain::block_count(cfg.chunk_size + chunk::TAG_SIZE, cfg.block_size);
    if (blocks > UINT16_MAX)
    {
        return fail(err, Errc::BadConfig,
                    "chunk_size/block_size gives " + std::to_string(blocks) +
                        " blocks per chunk, the packet header allows 65535");
    }
    return true;
}

}  // namespace config
