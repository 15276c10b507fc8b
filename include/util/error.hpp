#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace framevault
{

// Terminal failure kinds of an encode/decode call.
enum class Errc
{
    Ok = 0,
    InputNotFound,
    UnsupportedContainer,
    MetadataCorrupt,
    MissingChunk,
    InsufficientPackets,
    IntegrityMismatch,
    DecryptionFailed,
    BadConfig,
    Io
};

struct Error
{
    Errc         code{Errc::Ok};
    std::int64_t index{-1};  // chunk index where one applies
    std::string  detail;

    bool ok() const { return code == Errc::Ok; }
};

inline const char *errc_name(Errc c)
{
    switch (c)
    {
        case Errc::Ok:
            return "Ok";
        case Errc::InputNotFound:
            return "InputNotFound";
        case Errc::UnsupportedContainer:
            return "UnsupportedContainer";
        case Errc::MetadataCorrupt:
            return "MetadataCorrupt";
        case Errc::MissingChunk:
            return "MissingChunk";
        case Errc::InsufficientPackets:
            return "InsufficientPackets";
        case Errc::IntegrityMismatch:
            return "IntegrityMismatch";
        case Errc::DecryptionFailed:
            return "DecryptionFailed";
        case Errc::BadConfig:
            return "BadConfig";
        case Errc::Io:
            return "Io";
    }
    return "?";
}

// Fills `err` and returns false so call sites can `return fail(...)`.
inline bool fail(Error &err, Errc code, std::string detail, std::int64_t index = -1)
{
    err.code   = code;
    err.index  = index;
    err.detail = std::move(detail);
    return false;
}

inline std::string describe(const Error &err)
{
    std::string s = errc_name(err.code);
    if (err.index >= 0)
        s += "(" + std::to_string(err.index) + ")";
    if (!err.detail.empty())
        s += ": " + err.detail;
    return s;
}

}  // namespace framevault
