// tests/test_config.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/error.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Config, DefaultsAreValid)
{
    EnvGuard w("FRAMEVAULT_WIDTH"), r("FRAMEVAULT_REDUNDANCY");
    w.unset();
    r.unset();

    config::Config cfg = config::from_env();
    EXPECT_EQ(cfg.width, config::DEFAULT_WIDTH);
    EXPECT_EQ(cfg.chunk_size, config::DEFAULT_CHUNK_SIZE);
    EXPECT_DOUBLE_EQ(cfg.redundancy, config::DEFAULT_REDUNDANCY);

    framevault::Error err;
    EXPECT_TRUE(config::validate(cfg, err));
    EXPECT_EQ(config::frame_capacity(cfg), 3840u * 2160u * 3u);
}

TEST(Config, EnvOverrides)
{
    EnvGuard w("FRAMEVAULT_WIDTH"), h("FRAMEVAULT_HEIGHT"), bs("FRAMEVAULT_BLOCK_SIZE"),
        r("FRAMEVAULT_REDUNDANCY"), t("FRAMEVAULT_THREADS");
    w.set("640");
    h.set("480");
    bs.set("512");
    r.set("2.5");
    t.set("4");

    config::Config cfg = config::from_env();
    EXPECT_EQ(cfg.width, 640u);
    EXPECT_EQ(cfg.height, 480u);
    EXPECT_EQ(cfg.block_size, 512u);
    EXPECT_DOUBLE_EQ(cfg.redundancy, 2.5);
    EXPECT_EQ(cfg.threads, 4u);
}

TEST(Config, MalformedEnvIgnoredWithWarning)
{
    EnvGuard w("FRAMEVAULT_WIDTH"), r("FRAMEVAULT_REDUNDANCY");
    w.set("wide");
    r.set("-");

    framevault::set_log_level(framevault::Level::Warning);
    testing::internal::CaptureStderr();
    config::Config cfg = config::from_env();
    std::string    log = testing::internal::GetCapturedStderr();
    framevault::set_log_level(framevault::Level::Info);

    EXPECT_EQ(cfg.width, config::DEFAULT_WIDTH);
    EXPECT_DOUBLE_EQ(cfg.redundancy, config::DEFAULT_REDUNDANCY);
    EXPECT_NE(log.find("FRAMEVAULT_WIDTH"), std::string::npos);
    EXPECT_NE(log.find("[WARN]"), std::string::npos);
}

TEST(Config, OutOfRangeEnvIgnoredWithWarning)
{
    EnvGuard w("FRAMEVAULT_WIDTH"), h("FRAMEVAULT_HEIGHT"), f("FRAMEVAULT_FPS"),
        t("FRAMEVAULT_THREADS");
    // 2^32 + 1 would wrap to 1 in a u32
    w.set("4294967297");
    h.set("4294967295");
    f.set("18446744073709551615");
    t.set("4294967296");

    framevault::set_log_level(framevault::Level::Warning);
    testing::internal::CaptureStderr();
    config::Config cfg = config::from_env();
    std::string    log = testing::internal::GetCapturedStderr();
    framevault::set_log_level(framevault::Level::Info);

    EXPECT_EQ(cfg.width, config::DEFAULT_WIDTH);
    EXPECT_EQ(cfg.height, 4294967295u);
    EXPECT_EQ(cfg.fps, config::Config{}.fps);
    EXPECT_EQ(cfg.threads, config::Config{}.threads);
    EXPECT_NE(log.find("FRAMEVAULT_WIDTH"), std::string::npos);
    EXPECT_NE(log.find("FRAMEVAULT_FPS"), std::string::npos);
    EXPECT_NE(log.find("FRAMEVAULT_THREADS"), std::string::npos);
    EXPECT_EQ(log.find("FRAMEVAULT_HEIGHT"), std::string::npos);
    EXPECT_NE(log.find("out of range"), std::string::npos);
}

TEST(Config, ValidateRejects)
{
    auto rejects = [](config::Config cfg) {
        framevault::Error err;
        bool              ok = config::validate(cfg, err);
        return !ok && err.code == framevault::Errc::BadConfig;
    };

    config::Config base;
    config::Config c;

    c       = base;
    c.width = 0;
    EXPECT_TRUE(rejects(c));

    c        = base;
    c.width  = 3;
    c.height = 1;
    EXPECT_TRUE(rejects(c));

    c     = base;
    c.fps = 0;
    EXPECT_TRUE(rejects(c));

    c            = base;
    c.chunk_size = 0;
    EXPECT_TRUE(rejects(c));

    c            = base;
    c.block_size = 70000;
    EXPECT_TRUE(rejects(c));

    c            = base;
    c.redundancy = 0.9;
    EXPECT_TRUE(rejects(c));

    c         = base;
    c.threads = 0;
    EXPECT_TRUE(rejects(c));

    // 8x8 frame: 192 bytes, a 1024-byte block does not fit
    c        = base;
    c.width  = 8;
    c.height = 8;
    EXPECT_TRUE(rejects(c));

    // more than 65535 blocks per chunk
    c            = base;
    c.chunk_size = 1 << 20;
    c.block_size = 8;
    EXPECT_TRUE(rejects(c));

    EXPECT_FALSE(rejects(base));
}

TEST(Log, LevelByName)
{
    framevault::set_log_level_by_name("debug");
    EXPECT_EQ(framevault::global_level(), framevault::Level::Debug);
    framevault::set_log_level_by_name("ERROR");
    EXPECT_EQ(framevault::global_level(), framevault::Level::Error);
    framevault::set_log_level_by_name("off");
    EXPECT_EQ(framevault::global_level(), framevault::Level::Off);
    framevault::set_log_level_by_name("nonsense");
    EXPECT_EQ(framevault::global_level(), framevault::Level::Info);
    framevault::set_log_level_by_name(nullptr);
    EXPECT_EQ(framevault::global_level(), framevault::Level::Info);
}

TEST(Log, FilteredBelowLevel)
{
    framevault::set_log_level(framevault::Level::Error);
    testing::internal::CaptureStderr();
    LOG_INFO("hidden %d", 1);
    LOG_ERROR("shown %d", 2);
    std::string out = testing::internal::GetCapturedStderr();
    framevault::set_log_level(framevault::Level::Info);

    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[ERROR]"), std::string::npos);
    EXPECT_NE(out.find("shown 2"), std::string::npos);
}

TEST(Errors, DescribeAndExitCodes)
{
    framevault::Error err;
    EXPECT_TRUE(err.ok());
    EXPECT_EQ(exitc::from_error(err), exitc::ok);

    EXPECT_FALSE(framevault::fail(err, framevault::Errc::MissingChunk, "no packets", 2));
    EXPECT_EQ(framevault::describe(err), "MissingChunk(2): no packets");
    EXPECT_EQ(exitc::from_error(err), exitc::corrupt);

    framevault::fail(err, framevault::Errc::DecryptionFailed, "");
    EXPECT_EQ(framevault::describe(err), "DecryptionFailed");
    EXPECT_EQ(exitc::from_error(err), exitc::auth);
}
