#include <algorithm>
#include <cstdlib>
#include <sodium.h>

#include "crypto/envelope.hpp"
#include "util/log.hpp"

namespace aead
{

static_assert(aead::KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES, "key size mismatch");
static_assert(aead::TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES, "tag size mismatch");
static_assert(crypto_auth_hmacsha256_BYTES == 32, "HMAC-SHA256 output size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

// 16 stored nonce bytes -> 24-byte XChaCha20 nonce
static void expand_nonce(const std::uint8_t *nonce16,
                         std::uint8_t npub[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES])
{
    crypto_generichash(npub, crypto_aead_xchacha20poly1305_ietf_NPUBBYTES, nonce16, NONCE_SIZE,
                       nullptr, 0);
}

bool derive_key(std::string_view    password,
                const std::uint8_t *salt,
                std::size_t         salt_len,
                std::uint32_t       iterations,
                std::uint8_t       *out,
                std::size_t         out_len)
{
    if (!ensure_sodium_init() || out_len == 0 || iterations == 0)
        return false;

    // keyed once with the password, copied for every HMAC
    crypto_auth_hmacsha256_state base;
    crypto_auth_hmacsha256_init(&base, reinterpret_cast<const unsigned char *>(password.data()),
                                password.size());

    std::uint8_t u[crypto_auth_hmacsha256_BYTES];
    std::uint8_t t[crypto_auth_hmacsha256_BYTES];
    std::size_t  done = 0;
    for (std::uint32_t block = 1; done < out_len; block++)
    {
        const std::uint8_t be[4] = {static_cast<std::uint8_t>(block >> 24),
                                    static_cast<std::uint8_t>(block >> 16),
                                    static_cast<std::uint8_t>(block >> 8),
                                    static_cast<std::uint8_t>(block)};

        crypto_auth_hmacsha256_state st = base;
        crypto_auth_hmacsha256_update(&st, salt, salt_len);
        crypto_auth_hmacsha256_update(&st, be, sizeof(be));
        crypto_auth_hmacsha256_final(&st, u);
        std::memcpy(t, u, sizeof(t));

        for (std::uint32_t i = 1; i < iterations; i++)
        {
            st = base;
            crypto_auth_hmacsha256_update(&st, u, sizeof(u));
            crypto_auth_hmacsha256_final(&st, u);
            for (std::size_t j = 0; j < sizeof(t); j++)
                t[j] ^= u[j];
        }

        const std::size_t take = std::min(sizeof(t), out_len - done);
        std::memcpy(out + done, t, take);
        done += take;
        sodium_memzero(&st, sizeof(st));
    }

    sodium_memzero(u, sizeof(u));
    sodium_memzero(t, sizeof(t));
    sodium_memzero(&base, sizeof(base));
    return true;
}

SodiumEnvelope::SodiumEnvelope(std::string password, std::uint32_t iterations)
    : password_(std::move(password)), iterations_(iterations)
{
}

SodiumEnvelope::SodiumEnvelope(const SodiumEnvelope &other)
    : password_(other.password_), iterations_(other.iterations_)
{
}

SodiumEnvelope::~SodiumEnvelope()
{
    if (!password_.empty() && ensure_sodium_init())
        sodium_memzero(&password_[0], password_.size());
}

std::optional<SodiumEnvelope> SodiumEnvelope::FromEnv(const char *env_var)
{
    if (!env_var)
        return std::nullopt;
    const char *s = std::getenv(env_var);
    if (!s || !*s)
        return std::nullopt;
    return SodiumEnvelope{std::string(s)};
}

bool SodiumEnvelope::seal(const std::vector<std::uint8_t> &plaintext,
                          std::vector<std::uint8_t>       &out)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return false;
    }

    // output format = [salt | nonce | tag | c]
    std::vector<std::uint8_t> env(HEADER_SIZE + plaintext.size());
    std::uint8_t             *salt  = env.data();
    std::uint8_t             *nonce = env.data() + SALT_SIZE;
    std::uint8_t             *tag   = env.data() + SALT_SIZE + NONCE_SIZE;
    std::uint8_t             *c     = env.data() + HEADER_SIZE;

    randombytes_buf(salt, SALT_SIZE);
    randombytes_buf(nonce, NONCE_SIZE);

    std::uint8_t key[KEY_SIZE];
    if (!derive_key(password_, salt, SALT_SIZE, iterations_, key, sizeof(key)))
        return false;

    std::uint8_t npub[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
    expand_nonce(nonce, npub);

    unsigned long long maclen = 0;
    const int          rc     = crypto_aead_xchacha20poly1305_ietf_encrypt_detached(
        c, tag, &maclen, plaintext.data(), plaintext.size(), /*ad=*/nullptr, 0,
        /*nsec=*/nullptr, npub, key);
    sodium_memzero(key, sizeof(key));

    if (rc != 0 || maclen != TAG_SIZE)
    {
        LOG_ERROR("seal: encryption failed");
        return false;
    }
    out.swap(env);
    return true;
}

bool SodiumEnvelope::open(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return false;
    }
    if (in.size() < HEADER_SIZE)
    {
        LOG_ERROR("open: envelope too short (%zu bytes)", in.size());
        return false;
    }

    const std::uint8_t *salt  = in.data();
    const std::uint8_t *nonce = in.data() + SALT_SIZE;
    const std::uint8_t *tag   = in.data() + SALT_SIZE + NONCE_SIZE;
    const std::uint8_t *c     = in.data() + HEADER_SIZE;
    const std::size_t   clen  = in.size() - HEADER_SIZE;

    std::uint8_t key[KEY_SIZE];
    if (!derive_key(password_, salt, SALT_SIZE, iterations_, key, sizeof(key)))
        return false;

    std::uint8_t npub[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
    expand_nonce(nonce, npub);

    std::vector<std::uint8_t> m(clen);
    const int                 rc = crypto_aead_xchacha20poly1305_ietf_decrypt_detached(
        m.data(), /*nsec=*/nullptr, c, clen, tag, /*ad=*/nullptr, 0, npub, key);
    sodium_memzero(key, sizeof(key));

    if (rc != 0)
    {
        LOG_ERROR("open: authentication failed (wrong password or corrupted data)");
        return false;
    }
    out.swap(m);
    return true;
}

}  // namespace aead
