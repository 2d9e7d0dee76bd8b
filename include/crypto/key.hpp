#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace crypto
{

constexpr std::size_t KEY_SIZE   = 32;  // crypto_aead_xchacha20poly1305_ietf_KEYBYTES
constexpr std::size_t NONCE_SIZE = 24;  // crypto_aead_xchacha20poly1305_ietf_NPUBBYTES
constexpr std::size_t TAG_SIZE   = 16;  // crypto_aead_xchacha20poly1305_ietf_ABYTES

// Session key produced by the (external) key exchange.
class Key
{
  public:
    virtual ~Key() = default;

    virtual bool encrypt_data(const std::vector<std::uint8_t> &in,
                              std::vector<std::uint8_t>       &out) = 0;

    virtual bool decrypt_data(const std::vector<std::uint8_t> &in,
                              std::vector<std::uint8_t>       &out) = 0;
};

// libsodium XChaCha20-Poly1305; output is [NONCE | ciphertext | TAG]
class SodiumKey : public Key
{
  public:
    explicit SodiumKey(const std::array<std::uint8_t, KEY_SIZE> &key) : key_(key) {}
    ~SodiumKey() override;

    bool encrypt_data(const std::vector<std::uint8_t> &in,
                      std::vector<std::uint8_t>       &out) override;

    bool decrypt_data(const std::vector<std::uint8_t> &in,
                      std::vector<std::uint8_t>       &out) override;

    // 64 hex characters; surrounding blanks are ignored
    static std::optional<SodiumKey> from_hex(std::string_view hex);
    static std::optional<SodiumKey> from_env(const char *env_var);

  private:
    std::array<std::uint8_t, KEY_SIZE> key_{};
};

}  // namespace crypto
