#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aead
{

constexpr std::size_t   SALT_SIZE      = 16;
constexpr std::size_t   NONCE_SIZE     = 16;  // stored; expanded to the 24-byte XChaCha nonce
constexpr std::size_t   TAG_SIZE       = 16;  // crypto_aead_xchacha20poly1305_ietf_ABYTES
constexpr std::size_t   KEY_SIZE       = 32;  // crypto_aead_xchacha20poly1305_ietf_KEYBYTES
constexpr std::size_t   HEADER_SIZE    = SALT_SIZE + NONCE_SIZE + TAG_SIZE;
constexpr std::uint32_t KDF_ITERATIONS = 100000;

// PBKDF2-HMAC-SHA256. Returns false if libsodium cannot be initialised or out_len is 0.
bool derive_key(std::string_view    password,
                const std::uint8_t *salt,
                std::size_t         salt_len,
                std::uint32_t       iterations,
                std::uint8_t       *out,
                std::size_t         out_len);

// Whole-payload envelope: [salt 16][nonce 16][tag 16][ciphertext]
class Envelope
{
  public:
    virtual ~Envelope() = default;

    virtual bool seal(const std::vector<std::uint8_t> &plaintext,
                      std::vector<std::uint8_t>       &out) = 0;

    // False on a wrong password, truncation or any tampering.
    virtual bool open(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) = 0;
};

class NoopEnvelope : public Envelope
{
  public:
    bool seal(const std::vector<std::uint8_t> &plaintext, std::vector<std::uint8_t> &out) override
    {
        // same layout as the real envelope, all header bytes zero, no secrecy
        out.assign(HEADER_SIZE, 0);
        out.insert(out.end(), plaintext.begin(), plaintext.end());
        return true;
    }

    bool open(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override
    {
        if (in.size() < HEADER_SIZE)
            return false;
        out.assign(in.begin() + HEADER_SIZE, in.end());
        return true;
    }
};

// libsodium-based implementation: PBKDF2-HMAC-SHA256 key, XChaCha20-Poly1305 detached tag.
class SodiumEnvelope : public Envelope
{
  public:
    explicit SodiumEnvelope(std::string password, std::uint32_t iterations = KDF_ITERATIONS);
    ~SodiumEnvelope() override;

    SodiumEnvelope(const SodiumEnvelope &other);
    SodiumEnvelope &operator=(const SodiumEnvelope &other) = delete;

    bool seal(const std::vector<std::uint8_t> &plaintext, std::vector<std::uint8_t> &out) override;
    bool open(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override;

    // Password from an environment variable; nullopt when unset or empty.
    static std::optional<SodiumEnvelope> FromEnv(const char *env_var);

  private:
    std::string   password_;
    std::uint32_t iterations_;
};

}  // namespace aead
