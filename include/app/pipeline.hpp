#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "crypto/envelope.hpp"
#include "proto/metadata.hpp"
#include "store/iframe_store.hpp"
#include "util/config.hpp"
#include "util/error.hpp"

/*
encode:
  payload -> [envelope.seal] -> Metadata -> chunk::split -> fountain::Encoder per chunk
    -> frames: [metadata length][metadata ...][chunk 0 packets ...][chunk 1 packets ...] ...
decode:
  frames -> Metadata -> group data frames by chunk index -> MissingChunk check
    -> fountain::Decoder per chunk -> chunk::reassemble (CRC) -> truncate to file_size
    -> [envelope.open]
*/

namespace app
{

// Extension fields the encoder records next to the required metadata.
inline constexpr const char *META_BLOCK_SIZE = "block_size";
inline constexpr const char *META_REDUNDANCY = "redundancy";

struct EncodeStats
{
    std::size_t payload_bytes{0};  // after sealing
    std::size_t chunks{0};
    std::size_t packets{0};
    std::size_t metadata_frames{0};  // length frame included
    std::size_t data_frames{0};
};

struct DecodeStats
{
    std::size_t data_frames{0};
    std::size_t ignored_frames{0};  // blank, malformed or out-of-range chunk index
    std::size_t chunks{0};
};

class Encoder
{
  public:
    // `envelope` may be null (no encryption); it must outlive the encoder.
    explicit Encoder(const config::Config &cfg, aead::Envelope *envelope = nullptr);

    bool encode(const std::vector<std::uint8_t> &payload,
                const std::string               &filename,
                store::FrameWriter              &out,
                framevault::Error               &err,
                const std::vector<meta::Field>  &extra = {});

    const EncodeStats    &stats() const { return stats_; }
    const meta::Metadata &metadata() const { return meta_; }

  private:
    config::Config  cfg_;
    aead::Envelope *envelope_;
    EncodeStats     stats_{};
    meta::Metadata  meta_{};
};

class Decoder
{
  public:
    // `envelope` is only consulted when the metadata says the payload is encrypted.
    explicit Decoder(const config::Config &cfg, aead::Envelope *envelope = nullptr);

    // Consumes the metadata length frame and the metadata frames.
    bool read_metadata(store::FrameReader &in, meta::Metadata &out, framevault::Error &err);

    // Full decode. `out` is only written on success.
    bool decode(store::FrameReader &in, std::vector<std::uint8_t> &out, framevault::Error &err);

    const meta::Metadata &metadata() const { return meta_; }
    const DecodeStats    &stats() const { return stats_; }

  private:
    std::size_t block_size_for(const meta::Metadata &m) const;

    config::Config  cfg_;
    aead::Envelope *envelope_;
    DecodeStats     stats_{};
    meta::Metadata  meta_{};
};

// File level wrappers around the raw frame container. Outputs are staged and renamed into
// place only on success.
bool encode_file(const config::Config &cfg,
                 const std::string    &input,
                 const std::string    &output,
                 aead::Envelope       *envelope,
                 framevault::Error    &err);

bool decode_file(const config::Config &cfg,
                 const std::string    &input,
                 const std::string    &output,
                 aead::Envelope       *envelope,
                 framevault::Error    &err,
                 meta::Metadata       *info = nullptr);

bool read_info(const std::string &input, meta::Metadata &out, framevault::Error &err);

}  // namespace app
