#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "util/error.hpp"

/*
Wire: [length u32 LE][UTF-8 text]
Text: one "key=value\n" line per field. Required fields come first in a fixed order, extension
fields follow in insertion order and survive a deserialize/serialize cycle unchanged.

  version=1.0.0
  filename=report.pdf
  file_size=1048576
  chunk_size=65536
  num_chunks=16
  encrypted=false
  timestamp=2024-05-01T12:00:00Z
*/

namespace meta
{

inline constexpr const char *FORMAT_VERSION = "1.0.0";

using Field = std::pair<std::string, std::string>;

struct Metadata
{
    std::string        version = FORMAT_VERSION;
    std::string        filename;
    std::uint64_t      file_size{0};
    std::uint64_t      chunk_size{0};
    std::uint64_t      num_chunks{0};
    bool               encrypted{false};
    std::string        timestamp;
    std::vector<Field> extra;

    // Adds or replaces an extension field. Rejects required names and keys outside [A-Za-z0-9_.-].
    bool set_extra(const std::string &key, const std::string &value);
    const std::string *find_extra(const std::string &key) const;
};

Metadata create(const std::string &filename,
                std::uint64_t      file_size,
                std::uint64_t      chunk_size,
                bool               encrypted);

// Current UTC time as YYYY-MM-DDTHH:MM:SSZ.
std::string utc_timestamp();

bool valid_key(const std::string &key);

std::vector<std::uint8_t> serialize(const Metadata &m);

// `data` starts at the length prefix. Fails with MetadataCorrupt naming the offending field.
bool deserialize(const std::uint8_t *data, std::size_t len, Metadata &out, framevault::Error &err);

bool validate(const Metadata &m, framevault::Error &err);

}  // namespace meta
