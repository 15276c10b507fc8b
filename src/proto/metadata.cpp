#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <unordered_set>

#include "proto/chunk.hpp"
#include "proto/metadata.hpp"
#include "util/bytes.hpp"
#include "util/log.hpp"

namespace meta
{

namespace
{
constexpr const char *K_VERSION    = "version";
constexpr const char *K_FILENAME   = "filename";
constexpr const char *K_FILE_SIZE  = "file_size";
constexpr const char *K_CHUNK_SIZE = "chunk_size";
constexpr const char *K_NUM_CHUNKS = "num_chunks";
constexpr const char *K_ENCRYPTED  = "encrypted";
constexpr const char *K_TIMESTAMP  = "timestamp";

const char *const REQUIRED[] = {K_VERSION,    K_FILENAME,  K_FILE_SIZE, K_CHUNK_SIZE,
                                K_NUM_CHUNKS, K_ENCRYPTED, K_TIMESTAMP};

bool is_required(const std::string &key)
{
    for (const char *r : REQUIRED)
    {
        if (key == r)
            return true;
    }
    return false;
}

void append_escaped(std::string &out, const std::string &v)
{
    for (char c : v)
    {
        switch (c)
        {
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out.push_back(c);
        }
    }
}

bool unescape(const std::string &in, std::string &out)
{
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); i++)
    {
        if (in[i] != '\\')
        {
            out.push_back(in[i]);
            continue;
        }
        if (++i >= in.size())
            return false;
        switch (in[i])
        {
            case '\\':
                out.push_back('\\');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            default:
                return false;
        }
    }
    return true;
}

bool parse_u64(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s.size() > 20)
        return false;
    std::uint64_t v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10)
            return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

void put_line(std::string &out, const char *key, const std::string &value)
{
    out += key;
    out.push_back('=');
    append_escaped(out, value);
    out.push_back('\n');
}

bool corrupt(framevault::Error &err, const std::string &what)
{
    LOG_ERROR("metadata corrupt: %s", what.c_str());
    return framevault::fail(err, framevault::Errc::MetadataCorrupt, what);
}
}  // namespace

bool valid_key(const std::string &key)
{
    if (key.empty())
        return false;
    return std::all_of(key.begin(), key.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '_' || c == '.' || c == '-';
    });
}

bool Metadata::set_extra(const std::string &key, const std::string &value)
{
    if (!valid_key(key) || is_required(key))
    {
        LOG_WARN("set_extra: rejecting key '%s'", key.c_str());
        return false;
    }
    for (auto &f : extra)
    {
        if (f.first == key)
        {
            f.second = value;
            return true;
        }
    }
    extra.emplace_back(key, value);
    return true;
}

const std::string *Metadata::find_extra(const std::string &key) const
{
    for (const auto &f : extra)
    {
        if (f.first == key)
            return &f.second;
    }
    return nullptr;
}

std::string utc_timestamp()
{
    const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm           tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

Metadata create(const std::string &filename,
                std::uint64_t      file_size,
                std::uint64_t      chunk_size,
                bool               encrypted)
{
    Metadata m;
    m.filename   = filename;
    m.file_size  = file_size;
    m.chunk_size = chunk_size;
    m.num_chunks = chunk::count(static_cast<std::size_t>(file_size),
                                static_cast<std::size_t>(chunk_size));
    m.encrypted  = encrypted;
    m.timestamp  = utc_timestamp();
    return m;
}

std::vector<std::uint8_t> serialize(const Metadata &m)
{
    std::string text;
    put_line(text, K_VERSION, m.version);
    put_line(text, K_FILENAME, m.filename);
    put_line(text, K_FILE_SIZE, std::to_string(m.file_size));
    put_line(text, K_CHUNK_SIZE, std::to_string(m.chunk_size));
    put_line(text, K_NUM_CHUNKS, std::to_string(m.num_chunks));
    put_line(text, K_ENCRYPTED, m.encrypted ? "true" : "false");
    put_line(text, K_TIMESTAMP, m.timestamp);
    for (const auto &f : m.extra)
    {
        if (!valid_key(f.first) || is_required(f.first))
        {
            LOG_WARN("serialize: dropping extension field with invalid key '%s'", f.first.c_str());
            continue;
        }
        put_line(text, f.first.c_str(), f.second);
    }

    std::vector<std::uint8_t> out;
    out.reserve(4 + text.size());
    bytes::append_u32le(out, static_cast<std::uint32_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

bool deserialize(const std::uint8_t *data, std::size_t len, Metadata &out, framevault::Error &err)
{
    if (len < 4)
        return corrupt(err, "missing length prefix");
    const std::uint32_t text_len = bytes::get_u32le(data);
    if (text_len > len - 4)
    {
        return corrupt(err, "length prefix " + std::to_string(text_len) + " exceeds " +
                                std::to_string(len - 4) + " available bytes");
    }

    const std::string               text(reinterpret_cast<const char *>(data + 4), text_len);
    Metadata                        m;
    std::unordered_set<std::string> seen;
    std::size_t                     pos = 0;
    while (pos < text.size())
    {
        const std::size_t nl = text.find('\n', pos);
        if (nl == std::string::npos)
            return corrupt(err, "unterminated line");
        const std::string line = text.substr(pos, nl - pos);
        pos                    = nl + 1;

        const std::size_t eq = line.find('=');
        if (eq == std::string::npos)
            return corrupt(err, "line without '='");
        const std::string key = line.substr(0, eq);
        std::string       value;
        if (!valid_key(key))
            return corrupt(err, "invalid key '" + key + "'");
        if (!unescape(line.substr(eq + 1), value))
            return corrupt(err, "bad escape in field " + key);
        if (!seen.insert(key).second)
            return corrupt(err, "duplicate field " + key);

        if (key == K_VERSION)
            m.version = value;
        else if (key == K_FILENAME)
            m.filename = value;
        else if (key == K_FILE_SIZE)
        {
            if (!parse_u64(value, m.file_size))
                return corrupt(err, "field file_size is not a number");
        }
        else if (key == K_CHUNK_SIZE)
        {
            if (!parse_u64(value, m.chunk_size))
                return corrupt(err, "field chunk_size is not a number");
        }
        else if (key == K_NUM_CHUNKS)
        {
            if (!parse_u64(value, m.num_chunks))
                return corrupt(err, "field num_chunks is not a number");
        }
        else if (key == K_ENCRYPTED)
        {
            if (value != "true" && value != "false")
                return corrupt(err, "field encrypted is not a boolean");
            m.encrypted = (value == "true");
        }
        else if (key == K_TIMESTAMP)
            m.timestamp = value;
        else
            m.extra.emplace_back(key, value);
    }

    for (const char *r : REQUIRED)
    {
        if (!seen.count(r))
            return corrupt(err, std::string("missing required field ") + r);
    }
    if (!validate(m, err))
        return false;
    out = std::move(m);
    return true;
}

bool validate(const Metadata &m, framevault::Error &err)
{
    if (m.version.empty())
        return corrupt(err, "field version is empty");
    if (m.chunk_size == 0)
        return corrupt(err, "field chunk_size is zero");
    const std::uint64_t expect = m.file_size / m.chunk_size + (m.file_size % m.chunk_size ? 1 : 0);
    if (m.num_chunks != expect)
    {
        return corrupt(err, "field num_chunks is " + std::to_string(m.num_chunks) + ", expected " +
                                std::to_string(expect));
    }
    return true;
}

}  // namespace meta
