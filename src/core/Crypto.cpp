#include "Crypto.hpp"

#include "../debug/log.hpp"
#include "../helpers/Encoding.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

static const char* lastOpensslError() {
    return ERR_error_string(ERR_get_error(), nullptr);
}

std::optional<std::vector<uint8_t>> NCrypto::randomBytes(size_t len) {
    std::vector<uint8_t> buf(len);
    if (RAND_bytes(buf.data(), (int)buf.size()) != 1) {
        Debug::log(ERR, "NCrypto::randomBytes: RAND_bytes: err {}", lastOpensslError());
        return std::nullopt;
    }
    return buf;
}

std::optional<std::string> NCrypto::randomHex(size_t bytes) {
    auto buf = randomBytes(bytes);
    if (!buf)
        return std::nullopt;
    return NEncoding::hexEncode(*buf);
}

std::vector<uint8_t> NCrypto::sha256(std::string_view in) {
    std::vector<uint8_t> buf(32);
    unsigned int         len = 0;

    if (!EVP_Digest(in.data(), in.size(), buf.data(), &len, EVP_sha256(), nullptr)) {
        Debug::log(ERR, "NCrypto::sha256: EVP_Digest: err {}", lastOpensslError());
        return {};
    }

    return buf;
}

std::string NCrypto::sha256Hex(std::string_view in) {
    return NEncoding::hexEncode(sha256(in));
}

std::optional<std::vector<uint8_t>> NCrypto::hkdfSha256(std::string_view secret, std::string_view salt, std::string_view info, size_t outLen) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!ctx)
        return std::nullopt;

    std::vector<uint8_t> out(outLen);
    size_t               len = out.size();

    if (EVP_PKEY_derive_init(ctx) <= 0 || EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx, (const unsigned char*)salt.data(), (int)salt.size()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx, (const unsigned char*)secret.data(), (int)secret.size()) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx, (const unsigned char*)info.data(), (int)info.size()) <= 0 || EVP_PKEY_derive(ctx, out.data(), &len) <= 0) {
        Debug::log(ERR, "NCrypto::hkdfSha256: derive failed: err {}", lastOpensslError());
        EVP_PKEY_CTX_free(ctx);
        return std::nullopt;
    }

    EVP_PKEY_CTX_free(ctx);

    if (len != outLen)
        return std::nullopt;

    return out;
}

bool NCrypto::ed25519Verify(const std::vector<uint8_t>& publicKey, const std::vector<uint8_t>& message, const std::vector<uint8_t>& signature) {
    if (publicKey.size() != CRYPTO_ED25519_KEY_LEN || signature.size() != CRYPTO_ED25519_SIG_LEN)
        return false;

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size());
    if (!pkey) {
        // not a point on the curve
        Debug::log(TRACE, "NCrypto::ed25519Verify: EVP_PKEY_new_raw_public_key: err {}", lastOpensslError());
        ERR_clear_error();
        return false;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        return false;
    }

    if (!EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey)) {
        Debug::log(ERR, "NCrypto::ed25519Verify: EVP_DigestVerifyInit: err {}", lastOpensslError());
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        return false;
    }

    int ret = EVP_DigestVerify(ctx, signature.data(), signature.size(), message.data(), message.size());

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);

    if (ret == 1)
        return true;

    if (ret != 0) {
        Debug::log(TRACE, "NCrypto::ed25519Verify: EVP_DigestVerify: err {}", lastOpensslError());
        ERR_clear_error();
    }

    return false;
}

std::optional<std::vector<uint8_t>> NCrypto::aeadSeal(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv, std::string_view aad, const std::vector<uint8_t>& plaintext) {
    if (key.size() != CRYPTO_AEAD_KEY_LEN || iv.size() != CRYPTO_AEAD_IV_LEN)
        return std::nullopt;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx)
        return std::nullopt;

    std::vector<uint8_t> out(plaintext.size() + CRYPTO_AEAD_TAG_LEN);
    int                  len = 0;

    if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)iv.size(), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1) {
        Debug::log(ERR, "NCrypto::aeadSeal: init: err {}", lastOpensslError());
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    if (!aad.empty() && EVP_EncryptUpdate(ctx, nullptr, &len, (const unsigned char*)aad.data(), (int)aad.size()) != 1) {
        Debug::log(ERR, "NCrypto::aeadSeal: aad: err {}", lastOpensslError());
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    if (EVP_EncryptUpdate(ctx, out.data(), &len, plaintext.data(), (int)plaintext.size()) != 1) {
        Debug::log(ERR, "NCrypto::aeadSeal: EVP_EncryptUpdate: err {}", lastOpensslError());
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx, out.data() + len, &finalLen) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, CRYPTO_AEAD_TAG_LEN, out.data() + plaintext.size()) != 1) {
        Debug::log(ERR, "NCrypto::aeadSeal: final: err {}", lastOpensslError());
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    EVP_CIPHER_CTX_free(ctx);

    return out;
}

std::optional<std::vector<uint8_t>> NCrypto::aeadOpen(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv, std::string_view aad, const std::vector<uint8_t>& sealed) {
    if (key.size() != CRYPTO_AEAD_KEY_LEN || iv.size() != CRYPTO_AEAD_IV_LEN || sealed.size() < CRYPTO_AEAD_TAG_LEN)
        return std::nullopt;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx)
        return std::nullopt;

    const size_t         CIPHERTEXT_LEN = sealed.size() - CRYPTO_AEAD_TAG_LEN;
    std::vector<uint8_t> tag(sealed.begin() + CIPHERTEXT_LEN, sealed.end());
    std::vector<uint8_t> out(CIPHERTEXT_LEN);
    int                  len = 0;

    if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, (int)iv.size(), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1) {
        Debug::log(ERR, "NCrypto::aeadOpen: init: err {}", lastOpensslError());
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    if (!aad.empty() && EVP_DecryptUpdate(ctx, nullptr, &len, (const unsigned char*)aad.data(), (int)aad.size()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    if (EVP_DecryptUpdate(ctx, out.data(), &len, sealed.data(), (int)CIPHERTEXT_LEN) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, CRYPTO_AEAD_TAG_LEN, tag.data()) != 1) {
        EVP_CIPHER_CTX_free(ctx);
        return std::nullopt;
    }

    int       finalLen = 0;
    const int RET      = EVP_DecryptFinal_ex(ctx, out.data() + len, &finalLen);
    EVP_CIPHER_CTX_free(ctx);

    if (RET <= 0) {
        // tag mismatch
        ERR_clear_error();
        OPENSSL_cleanse(out.data(), out.size());
        return std::nullopt;
    }

    return out;
}

bool NCrypto::constantTimeEquals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
