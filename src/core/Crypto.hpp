#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

constexpr const size_t CRYPTO_AEAD_KEY_LEN    = 32;
constexpr const size_t CRYPTO_AEAD_IV_LEN     = 12;
constexpr const size_t CRYPTO_AEAD_TAG_LEN    = 16;
constexpr const size_t CRYPTO_ED25519_KEY_LEN = 32;
constexpr const size_t CRYPTO_ED25519_SIG_LEN = 64;

// Thin wrappers around OpenSSL EVP. None of these keep state between calls, so
// they are safe to use from any thread.
namespace NCrypto {
    std::optional<std::vector<uint8_t>> randomBytes(size_t len);
    std::optional<std::string>          randomHex(size_t bytes);

    std::vector<uint8_t>                sha256(std::string_view in);
    std::string                         sha256Hex(std::string_view in);

    std::optional<std::vector<uint8_t>> hkdfSha256(std::string_view secret, std::string_view salt, std::string_view info, size_t outLen);

    bool                                ed25519Verify(const std::vector<uint8_t>& publicKey, const std::vector<uint8_t>& message, const std::vector<uint8_t>& signature);

    // AES-256-GCM. seal returns ciphertext || tag
    std::optional<std::vector<uint8_t>> aeadSeal(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv, std::string_view aad, const std::vector<uint8_t>& plaintext);
    std::optional<std::vector<uint8_t>> aeadOpen(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv, std::string_view aad, const std::vector<uint8_t>& sealed);

    bool                                constantTimeEquals(std::string_view a, std::string_view b);
};
