#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/*
Frame layout: width x height pixels, row-major, 3 interleaved channels (pixel p, channel c at
byte 3p + c).

  metadata length frame : pixels 0..3 hold the u32 LE metadata length, one byte per pixel,
                          replicated on all channels (readers use channel 0)
  metadata frames       : one metadata byte per pixel, replicated on all channels,
                          width*height bytes per frame
  data frame            : [chunk_index u32 LE][fountain packet] across all channels, zero padded
*/

namespace frame
{

inline constexpr std::size_t CHUNK_INDEX_SIZE   = 4;
inline constexpr std::size_t LENGTH_PREFIX_SIZE = 4;
inline constexpr std::size_t CHANNELS           = 3;

using Frame = std::vector<std::uint8_t>;

struct Geometry
{
    std::uint32_t width{0};
    std::uint32_t height{0};

    std::size_t pixels() const { return static_cast<std::size_t>(width) * height; }
    std::size_t bytes() const { return pixels() * CHANNELS; }
    bool        operator==(const Geometry &o) const { return width == o.width && height == o.height; }
    bool        operator!=(const Geometry &o) const { return !(*this == o); }
};

struct DataFrame
{
    std::uint32_t             chunk_index{0};
    std::vector<std::uint8_t> packet;  // trailing zeros stripped, see unpack()
};

// Largest fountain packet a data frame of this geometry carries.
std::size_t data_capacity(const Geometry &g);

bool pack_data(const Geometry                  &g,
               std::uint32_t                    chunk_index,
               const std::vector<std::uint8_t> &packet,
               Frame                           &out);

// Length frame followed by ceil(len / pixels) metadata frames.
std::vector<Frame> pack_metadata(const Geometry &g, const std::vector<std::uint8_t> &meta);

std::size_t metadata_frame_count(const Geometry &g, std::size_t meta_len);

bool read_metadata_length(const Frame &f, std::uint32_t &len);

// Appends up to `want` channel-0 bytes of a metadata frame to `out`; returns bytes appended.
std::size_t append_metadata_bytes(const Frame &f, std::size_t want, std::vector<std::uint8_t> &out);

// Flattened frame bytes with trailing zero bytes removed. The true length is not stored, so a
// payload that legitimately ends in zeros comes back shorter; readers that know their own
// length (fountain::parse) zero-extend it again.
std::vector<std::uint8_t> unpack(const Frame &f);

std::optional<DataFrame> unpack_data(const Frame &f);

}  // namespace frame
