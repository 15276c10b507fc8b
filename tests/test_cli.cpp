// tests/test_cli.cpp
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include "util/exitcodes.hpp"

namespace fs = std::filesystem;

namespace test_cli
{
static fs::path temp_dir()
{
    fs::path p = fs::temp_directory_path() / ("framevault-cli-test-" + std::to_string(::getpid()));
    fs::remove_all(p);
    fs::create_directories(p);
    return p;
}

static int run_cli(const std::string &args)
{
    // CMake injects the absolute path of the built binary
    std::string cmd = std::string("FRAMEVAULT_LOG_LEVEL=off ") + FRAMEVAULT_CLI_BIN + " " + args +
                      " >/dev/null 2>&1";
    int rc = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

static std::string slurp(const fs::path &p)
{
    std::ifstream i(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(i), std::istreambuf_iterator<char>());
}

// Keeps frames tiny so the test binary runs fast.
static const std::string SMALL = " --width 16 --height 8 --chunk-size 512 --block-size 64";
}  // namespace test_cli

TEST(CLI, EncodeDecodeRoundtrip)
{
    ::unsetenv("FRAMEVAULT_PASSWORD");
    const auto dir = test_cli::temp_dir();
    {
        std::ofstream o(dir / "in.txt", std::ios::binary);
        for (int i = 0; i < 500; ++i)
            o << "line " << i << "\n";
    }
    const std::string in  = (dir / "in.txt").string();
    const std::string vid = (dir / "v.fvr").string();
    const std::string out = (dir / "out.txt").string();

    EXPECT_EQ(test_cli::run_cli("encode -i " + in + " -o " + vid + test_cli::SMALL), exitc::ok);
    ASSERT_TRUE(fs::exists(vid));
    EXPECT_EQ(test_cli::run_cli("info -i " + vid), exitc::ok);
    EXPECT_EQ(test_cli::run_cli("decode -i " + vid + " -o " + out), exitc::ok);
    EXPECT_EQ(test_cli::slurp(out), test_cli::slurp(in));
    fs::remove_all(dir);
}

TEST(CLI, EncryptedRoundtripAndWrongPassword)
{
    ::unsetenv("FRAMEVAULT_PASSWORD");
    const auto dir = test_cli::temp_dir();
    {
        std::ofstream o(dir / "secret.bin", std::ios::binary);
        for (int i = 0; i < 3000; ++i)
            o.put(static_cast<char>(i * 7));
    }
    const std::string in  = (dir / "secret.bin").string();
    const std::string vid = (dir / "s.fvr").string();
    const std::string out = (dir / "out.bin").string();

    EXPECT_EQ(test_cli::run_cli("encode --encrypt -i " + in + " -o " + vid + test_cli::SMALL),
              exitc::bad_args);
    EXPECT_FALSE(fs::exists(vid));

    EXPECT_EQ(test_cli::run_cli("encode --encrypt -p p1 -i " + in + " -o " + vid + test_cli::SMALL),
              exitc::ok);
    EXPECT_EQ(test_cli::run_cli("decode -i " + vid + " -o " + out), exitc::auth);
    EXPECT_EQ(test_cli::run_cli("decode -p p2 -i " + vid + " -o " + out), exitc::auth);
    EXPECT_FALSE(fs::exists(out));

    EXPECT_EQ(test_cli::run_cli("decode -p p1 -i " + vid + " -o " + out), exitc::ok);
    EXPECT_EQ(test_cli::slurp(out), test_cli::slurp(in));
    fs::remove_all(dir);
}

TEST(CLI, UsageAndLookupErrors)
{
    const auto dir = test_cli::temp_dir();
    EXPECT_EQ(test_cli::run_cli(""), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli("frobnicate"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli("encode -i"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli("encode --width nope -i a -o b"), exitc::bad_args);
    EXPECT_EQ(test_cli::run_cli("--help"), exitc::ok);

    const std::string missing = (dir / "missing.bin").string();
    EXPECT_EQ(test_cli::run_cli("encode -i " + missing + " -o " + (dir / "x.fvr").string() +
                                test_cli::SMALL),
              exitc::not_found);
    EXPECT_EQ(test_cli::run_cli("info -i " + missing), exitc::not_found);

    // a 10x1 frame cannot hold a data packet
    {
        std::ofstream o(dir / "in.bin");
        o << "data";
    }
    EXPECT_EQ(test_cli::run_cli("encode -i " + (dir / "in.bin").string() + " -o " +
                                (dir / "y.fvr").string() + " --width 10 --height 1"),
              exitc::bad_args);
    EXPECT_FALSE(fs::exists(dir / "y.fvr"));
    fs::remove_all(dir);
}
