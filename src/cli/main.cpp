#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "app/pipeline.hpp"
#include "crypto/envelope.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  framevault [--log-level L] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  encode -i IN -o OUT.fvr [--encrypt] [-p PASSWORD]\n"
                 "         [--chunk-size N] [--block-size N] [--redundancy R]\n"
                 "         [--width W] [--height H] [--fps F] [--threads T]\n"
                 "  decode -i IN.fvr -o OUT [-p PASSWORD] [--threads T]\n"
                 "  info   -i IN.fvr\n"
                 "\n"
                 "The password may also come from FRAMEVAULT_PASSWORD.\n");
}

struct Options
{
    std::string                input;
    std::string                output;
    std::optional<std::string> password;
    bool                       encrypt{false};
    config::Config             cfg;
};

static bool parse_u64(const std::string &s, unsigned long long &out)
{
    if (s.empty() || s[0] == '-')
        return false;
    char *end = nullptr;
    errno     = 0;
    out       = std::strtoull(s.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0';
}

static bool parse_double(const std::string &s, double &out)
{
    if (s.empty())
        return false;
    char *end = nullptr;
    errno     = 0;
    out       = std::strtod(s.c_str(), &end);
    return errno == 0 && end && *end == '\0';
}

// Parses args[1..]; returns false after printing the problem.
static bool parse_options(const std::vector<std::string> &args, Options &o)
{
    for (size_t i = 1; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a == "--encrypt")
        {
            o.encrypt = true;
            continue;
        }
        if (i + 1 >= args.size())
        {
            std::fprintf(stderr, "error: %s expects a value\n", a.c_str());
            return false;
        }
        const std::string &v = args[++i];

        unsigned long long n = 0;
        if (a == "-i" || a == "--input")
            o.input = v;
        else if (a == "-o" || a == "--output")
            o.output = v;
        else if (a == "-p" || a == "--password")
            o.password = v;
        else if (a == "--redundancy")
        {
            if (!parse_double(v, o.cfg.redundancy))
            {
                std::fprintf(stderr, "error: invalid --redundancy: %s\n", v.c_str());
                return false;
            }
        }
        else if (a == "--chunk-size" || a == "--block-size" || a == "--width" ||
                 a == "--height" || a == "--fps" || a == "--threads")
        {
            if (!parse_u64(v, n) || n > UINT32_MAX)
            {
                std::fprintf(stderr, "error: invalid %s: %s\n", a.c_str(), v.c_str());
                return false;
            }
            if (a == "--chunk-size")
                o.cfg.chunk_size = static_cast<size_t>(n);
            else if (a == "--block-size")
                o.cfg.block_size = static_cast<size_t>(n);
            else if (a == "--width")
                o.cfg.width = static_cast<uint32_t>(n);
            else if (a == "--height")
                o.cfg.height = static_cast<uint32_t>(n);
            else if (a == "--fps")
                o.cfg.fps = static_cast<uint32_t>(n);
            else
                o.cfg.threads = static_cast<unsigned>(n);
        }
        else
        {
            std::fprintf(stderr, "error: unknown option: %s\n", a.c_str());
            return false;
        }
    }
    if (!o.password)
    {
        if (const char *e = std::getenv("FRAMEVAULT_PASSWORD"))
        {
            if (*e)
                o.password = std::string(e);
        }
    }
    return true;
}

static int report(const framevault::Error &err)
{
    std::fprintf(stderr, "error: %s\n", framevault::describe(err).c_str());
    return exitc::from_error(err);
}

static void print_info(const meta::Metadata &m)
{
    std::printf("version=%s\n", m.version.c_str());
    std::printf("filename=%s\n", m.filename.c_str());
    std::printf("file_size=%llu\n", static_cast<unsigned long long>(m.file_size));
    std::printf("chunk_size=%llu\n", static_cast<unsigned long long>(m.chunk_size));
    std::printf("num_chunks=%llu\n", static_cast<unsigned long long>(m.num_chunks));
    std::printf("encrypted=%s\n", m.encrypted ? "true" : "false");
    std::printf("timestamp=%s\n", m.timestamp.c_str());
    for (const auto &f : m.extra)
        std::printf("%s=%s\n", f.first.c_str(), f.second.c_str());
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args)
{
    Options o;
    o.cfg = config::from_env();

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"encode",
         [&]() -> int {
             if (o.input.empty() || o.output.empty())
             {
                 print_usage();
                 return exitc::bad_args;
             }
             if (o.encrypt && !o.password)
             {
                 std::fprintf(stderr, "error: --encrypt needs -p or FRAMEVAULT_PASSWORD\n");
                 return exitc::bad_args;
             }
             std::optional<aead::SodiumEnvelope> env;
             if (o.encrypt)
                 env.emplace(*o.password);

             framevault::Error err;
             if (!app::encode_file(o.cfg, o.input, o.output, env ? &*env : nullptr, err))
                 return report(err);
             return exitc::ok;
         }},
        {"decode",
         [&]() -> int {
             if (o.input.empty() || o.output.empty())
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::optional<aead::SodiumEnvelope> env;
             if (o.password)
                 env.emplace(*o.password);

             framevault::Error err;
             meta::Metadata    info;
             if (!app::decode_file(o.cfg, o.input, o.output, env ? &*env : nullptr, err, &info))
                 return report(err);
             std::printf("decoded %s -> %s\n", info.filename.c_str(), o.output.c_str());
             return exitc::ok;
         }},
        {"info",
         [&]() -> int {
             if (o.input.empty())
             {
                 print_usage();
                 return exitc::bad_args;
             }
             framevault::Error err;
             meta::Metadata    m;
             if (!app::read_info(o.input, m, err))
                 return report(err);
             print_info(m);
             return exitc::ok;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    if (!parse_options(args, o))
    {
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    if (const char *e = std::getenv("FRAMEVAULT_LOG_LEVEL"))
        framevault::set_log_level_by_name(e);

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        // global options only before the command
        if (args.empty() && a == "--log-level" && i + 1 < argc)
        {
            framevault::set_log_level_by_name(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    return run_cmd(args[0], args);
}
