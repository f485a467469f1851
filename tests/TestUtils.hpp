#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <openssl/evp.h>

#include "core/Network.hpp"
#include "core/Session.hpp"
#include "helpers/Encoding.hpp"
#include "helpers/TimeUtils.hpp"

constexpr const char* TEST_SECRET       = "0123456789abcdef0123456789abcdef-test";
constexpr const char* TEST_OTHER_SECRET = "fedcba9876543210fedcba9876543210-test";

// A wallet that signs the way Solana and Stellar wallets do.
class CTestWallet {
  public:
    CTestWallet() {
        EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
        if (!ctx || EVP_PKEY_keygen_init(ctx) <= 0 || EVP_PKEY_keygen(ctx, &m_key) <= 0) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("ed25519 keygen failed");
        }
        EVP_PKEY_CTX_free(ctx);
    }

    ~CTestWallet() {
        EVP_PKEY_free(m_key);
    }

    CTestWallet(const CTestWallet&)            = delete;
    CTestWallet& operator=(const CTestWallet&) = delete;

    Bytes publicKey() const {
        Bytes  out(32);
        size_t len = out.size();
        if (EVP_PKEY_get_raw_public_key(m_key, out.data(), &len) <= 0)
            throw std::runtime_error("no raw public key");
        return out;
    }

    Bytes sign(const Bytes& payload) const {
        EVP_MD_CTX* md  = EVP_MD_CTX_new();
        Bytes       sig(64);
        size_t      len = sig.size();
        if (!md || EVP_DigestSignInit(md, nullptr, nullptr, nullptr, m_key) <= 0 || EVP_DigestSign(md, sig.data(), &len, payload.data(), payload.size()) <= 0) {
            EVP_MD_CTX_free(md);
            throw std::runtime_error("ed25519 sign failed");
        }
        EVP_MD_CTX_free(md);
        return sig;
    }

    std::string solanaAddress() const {
        return NEncoding::base58Encode(publicKey());
    }

    std::string solanaSign(const std::string& message) const {
        return NEncoding::base58Encode(sign(Bytes{message.begin(), message.end()}));
    }

    std::string stellarAddress() const {
        return CStellarScheme::encodeAddress(publicKey());
    }

    std::string stellarSign(const std::string& message) const {
        return NEncoding::base64Encode(sign(CStellarScheme::signedPayload(message)));
    }

  private:
    EVP_PKEY* m_key = nullptr;
};

// Shared, manually advanced clock. Copies tick together.
class CFakeClock {
  public:
    CFakeClock(int64_t startMs = 1735732800000 /* 2025-01-01T12:00:00.000Z */) : m_ms(std::make_shared<std::atomic<int64_t>>(startMs)) {
        ;
    }

    ClockFn fn() const {
        auto ms = m_ms;
        return [ms]() { return NTimeUtils::fromEpochMs(ms->load()); };
    }

    TimePoint now() const {
        return NTimeUtils::fromEpochMs(m_ms->load());
    }

    void advance(std::chrono::milliseconds d) {
        *m_ms += d.count();
    }

  private:
    std::shared_ptr<std::atomic<int64_t>> m_ms;
};

inline SChallengeSettings testChallengeSettings(std::chrono::seconds timeout = std::chrono::seconds{300}) {
    return SChallengeSettings{
        .domain    = "example.com",
        .uri       = "https://example.com/login",
        .statement = "Sign in to Example",
        .version   = "1",
        .timeout   = timeout,
    };
}

inline SAuthSettings testAuthSettings(std::chrono::seconds timeout = std::chrono::seconds{300}) {
    SAuthSettings s;
    s.challenge = testChallengeSettings(timeout);
    s.secret    = TEST_SECRET;
    s.networks  = CNetworkRegistry::knownNetworks();
    return s;
}

inline std::string flipBit(std::string s, size_t bit) {
    s[bit / 8] ^= (char)(1 << (bit % 8));
    return s;
}
