#pragma once

#include "util/error.hpp"

namespace exitc
{
constexpr int ok        = 0;
constexpr int failure   = 1;
constexpr int bad_args  = 2;
constexpr int not_found = 3;
constexpr int corrupt   = 4;
constexpr int auth      = 5;

inline int from_error(const framevault::Error &err)
{
    using framevault::Errc;
    switch (err.code)
    {
        case Errc::Ok:
            return ok;
        case Errc::InputNotFound:
            return not_found;
        case Errc::UnsupportedContainer:
        case Errc::MetadataCorrupt:
        case Errc::MissingChunk:
        case Errc::InsufficientPackets:
        case Errc::IntegrityMismatch:
            return corrupt;
        case Errc::DecryptionFailed:
            return auth;
        case Errc::BadConfig:
            return bad_args;
        case Errc::Io:
            return failure;
    }
    return failure;
}
}  // namespace exitc
