#include <array>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <sodium.h>

#include "crypto/key.hpp"
#include "util/log.hpp"

namespace crypto
{

static_assert(KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES, "key size mismatch");
static_assert(NONCE_SIZE == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES, "nonce size mismatch");
static_assert(TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES, "tag size mismatch");

static bool ensure_sodium_init()
{
    static bool ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

SodiumKey::~SodiumKey()
{
    sodium_memzero(key_.data(), key_.size());
}

std::optional<SodiumKey> SodiumKey::from_hex(std::string_view hex)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("from_hex: sodium_init failed");
        return std::nullopt;
    }

    const auto first = hex.find_first_not_of(" \t\r\n");
    const auto last  = hex.find_last_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return std::nullopt;
    hex = hex.substr(first, last - first + 1);

    std::array<std::uint8_t, KEY_SIZE> key{};
    std::size_t                        out_len = 0;
    const char                        *end     = nullptr;
    if (sodium_hex2bin(key.data(), key.size(), hex.data(), hex.size(), nullptr, &out_len, &end) !=
            0 ||
        out_len != key.size() || end != hex.data() + hex.size())
    {
        sodium_memzero(key.data(), key.size());
        return std::nullopt;
    }
    SodiumKey k{key};
    sodium_memzero(key.data(), key.size());
    return k;
}

std::optional<SodiumKey> SodiumKey::from_env(const char *env_var)
{
    if (!env_var)
        return std::nullopt;
    const char *s = std::getenv(env_var);
    if (!s)
        return std::nullopt;
    return from_hex(s);
}

bool SodiumKey::encrypt_data(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    if (!ensure_sodium_init())
        return false;

    // output format = [NONCE | c] (c = mlen + TAG_SIZE)
    out.resize(NONCE_SIZE + in.size() + TAG_SIZE);

    unsigned char     *npub = out.data();
    unsigned char     *c    = out.data() + NONCE_SIZE;
    unsigned long long clen = 0;

    randombytes_buf(npub, NONCE_SIZE);
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        c, &clen, in.data(), in.size(), /*ad=*/nullptr, 0, /*nsec=*/nullptr, npub, key_.data());
    if (rc != 0)
    {
        LOG_ERROR("encrypt_data: AEAD encrypt failed");
        return false;
    }
    out.resize(NONCE_SIZE + static_cast<std::size_t>(clen));
    return true;
}

bool SodiumKey::decrypt_data(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    if (!ensure_sodium_init())
        return false;
    // [npub (NONCE_SIZE)] [c (ciphertext || tag)]
    if (in.size() < NONCE_SIZE + TAG_SIZE)
        return false;

    const unsigned char     *npub = in.data();
    const unsigned char     *c    = in.data() + NONCE_SIZE;
    const unsigned long long clen = in.size() - NONCE_SIZE;
    unsigned long long       mlen = 0;

    out.resize(clen - TAG_SIZE);
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        out.data(), &mlen, /*nsec=*/nullptr, c, clen, /*ad=*/nullptr, 0, npub, key_.data());
    if (rc != 0)
    {
        out.clear();
        return false;
    }
    out.resize(mlen);
    return true;
}

}  // namespace crypto
