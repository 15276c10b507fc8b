#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/*
Per-chunk rateless erasure code.

  Encoder(chunk bytes) -> blocks (block_size each, last one zero padded)
      -> packet(id) = XOR of select_blocks(id, num_blocks, max_degree)
         wire: [packet_id u32][block_count u16][block_index u16 ...][payload block_size]

  Decoder(block_size, num_blocks) <- packets in any order (duplicates ok)
      -> decode(): peeling. Degree-1 packets seed the known set, then any packet with exactly one
         unknown block resolves it. Stops on a pass without progress. No GF(2) elimination, so a
         set whose only remaining packets form degree>=2 cycles fails; raise redundancy instead.
*/

namespace fountain
{

inline constexpr std::size_t MAX_DEGREE   = 3;
inline constexpr std::size_t HDR_FIXED    = 6;                             // id + block_count
inline constexpr std::size_t MAX_HDR_SIZE = HDR_FIXED + 2 * MAX_DEGREE;  // 12

struct Header
{
    std::uint32_t              packet_id{0};
    std::vector<std::uint16_t> blocks;  // sorted ascending, distinct
};

struct Packet
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;  // block_size bytes
};

std::size_t block_count(std::size_t data_len, std::size_t block_size);

// ceil(num_blocks * redundancy), never below num_blocks.
std::size_t packet_count(std::size_t num_blocks, double redundancy);

// Deterministic block selection. Ids below num_blocks are source packets ({id}). Repair packet
// j = id - num_blocks draws a degree uniformly in [1, max_degree]; its indices are j mod num_blocks
// plus degree - 1 further distinct indices, sorted.
std::vector<std::uint16_t> select_blocks(std::uint32_t packet_id,
                                         std::size_t   num_blocks,
                                         std::size_t   max_degree);

std::vector<std::uint8_t> serialize(const Packet &p);

// Parses a packet whose trailing zero bytes may have been stripped: bytes past `len` read as zero
// up to the length implied by the header and block_size. Anything past that length is rejected.
std::optional<Packet> parse(const std::uint8_t *data, std::size_t len, std::size_t block_size);

class Encoder
{
  public:
    Encoder(const std::vector<std::uint8_t> &data, std::size_t block_size, double redundancy);

    std::size_t num_blocks() const { return blocks_.size(); }
    std::size_t num_packets() const { return num_packets_; }
    std::size_t block_size() const { return block_size_; }

    Packet packet(std::uint32_t packet_id) const;

    // All num_packets() packets in id order, serialized.
    std::vector<std::vector<std::uint8_t>> encode() const;

  private:
    std::size_t                            block_size_;
    std::size_t                            num_packets_{0};
    std::vector<std::vector<std::uint8_t>> blocks_;
};

class Decoder
{
  public:
    Decoder(std::size_t block_size, std::size_t num_blocks);

    bool add_packet(const std::vector<std::uint8_t> &bytes);
    bool add(Packet p);

    // num_blocks * block_size bytes on success, nullopt when the packets are insufficient.
    std::optional<std::vector<std::uint8_t>> decode();

    std::size_t packet_count() const { return packets_.size(); }
    std::size_t resolved_count() const { return resolved_; }
    std::size_t num_blocks() const { return num_blocks_; }

  private:
    std::size_t         block_size_;
    std::size_t         num_blocks_;
    std::size_t         resolved_{0};
    std::vector<Packet> packets_;
};

}  // namespace fountain
