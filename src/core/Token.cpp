#include "Token.hpp"

#include "Crypto.hpp"
#include "Db.hpp"
#include "Network.hpp"
#include "../debug/log.hpp"
#include "../helpers/Encoding.hpp"

#include <algorithm>
#include <stdexcept>

#include <glaze/glaze.hpp>

constexpr const int    TOKEN_CLAIMS_VERSION = 1;
constexpr const char*  TOKEN_AAD            = "walletgate-session-v1";
constexpr const char*  TOKEN_KDF_SALT       = "walletgate";
constexpr const char*  TOKEN_KDF_INFO       = "session-token-key-v1";
constexpr const size_t TOKEN_ID_BYTES       = 16;

struct STokenClaims {
    int         v               = TOKEN_CLAIMS_VERSION;
    std::string jti             = "";
    std::string address         = "";
    std::string network         = "";
    std::string profile_id      = "";
    int64_t     issued_at       = 0;
    int64_t     expiration_time = 0;
    int64_t     expires_at      = 0;
};

CSessionTokenCodec::CSessionTokenCodec(const std::string& secret, std::chrono::seconds sessionLifetime, std::shared_ptr<CNetworkRegistry> registry,
                                       std::shared_ptr<CDatabase> denylist, ClockFn clock) :
    m_sessionLifetime(sessionLifetime), m_registry(std::move(registry)), m_denylist(std::move(denylist)), m_clock(std::move(clock)) {
    if (secret.empty())
        throw std::invalid_argument("session token secret is empty");

    auto key = NCrypto::hkdfSha256(secret, TOKEN_KDF_SALT, TOKEN_KDF_INFO, CRYPTO_AEAD_KEY_LEN);
    if (!key)
        throw std::runtime_error("session token key derivation failed");

    m_key = std::move(*key);
}

TimePoint CSessionTokenCodec::expiryFor(const CVerifiedIdentity& identity) const {
    if (m_sessionLifetime.count() <= 0)
        return identity.expirationTime();

    return std::min(identity.expirationTime(), m_clock() + m_sessionLifetime);
}

std::expected<std::string, std::string> CSessionTokenCodec::encode(const CVerifiedIdentity& identity) {
    const auto TOKEN_ID = NCrypto::randomHex(TOKEN_ID_BYTES);
    const auto IV       = NCrypto::randomBytes(CRYPTO_AEAD_IV_LEN);
    if (!TOKEN_ID || !IV)
        return std::unexpected("no randomness available");

    STokenClaims claims{
        .v               = TOKEN_CLAIMS_VERSION,
        .jti             = *TOKEN_ID,
        .address         = identity.address(),
        .network         = identity.network(),
        .profile_id      = identity.profileId(),
        .issued_at       = NTimeUtils::toEpochMs(identity.issuedAt()),
        .expiration_time = NTimeUtils::toEpochMs(identity.expirationTime()),
        .expires_at      = NTimeUtils::toEpochMs(expiryFor(identity)),
    };

    const auto JSON = glz::write_json(claims);
    if (!JSON)
        return std::unexpected("failed to serialize claims");

    const auto SEALED = NCrypto::aeadSeal(m_key, *IV, TOKEN_AAD, std::vector<uint8_t>{JSON->begin(), JSON->end()});
    if (!SEALED)
        return std::unexpected("failed to seal claims");

    std::vector<uint8_t> raw;
    raw.reserve(IV->size() + SEALED->size());
    raw.insert(raw.end(), IV->begin(), IV->end());
    raw.insert(raw.end(), SEALED->begin(), SEALED->end());

    Debug::log(TRACE, "Minted session token {} for {} on {}", claims.jti, claims.address, claims.network);

    return TOKEN_PREFIX + NEncoding::base64UrlEncode(raw);
}

std::expected<SSession, eTokenError> CSessionTokenCodec::decode(const std::string& token) {
    if (!token.starts_with(TOKEN_PREFIX))
        return std::unexpected(TOKEN_ERROR_CORRUPT);

    const auto RAW = NEncoding::base64UrlDecode(std::string_view{token}.substr(std::string_view{TOKEN_PREFIX}.size()));
    if (!RAW || RAW->size() < CRYPTO_AEAD_IV_LEN + CRYPTO_AEAD_TAG_LEN)
        return std::unexpected(TOKEN_ERROR_CORRUPT);

    const std::vector<uint8_t> IV{RAW->begin(), RAW->begin() + CRYPTO_AEAD_IV_LEN};
    const std::vector<uint8_t> SEALED{RAW->begin() + CRYPTO_AEAD_IV_LEN, RAW->end()};

    // a rotated secret lands here as well, indistinguishable from tampering
    const auto PLAINTEXT = NCrypto::aeadOpen(m_key, IV, TOKEN_AAD, SEALED);
    if (!PLAINTEXT)
        return std::unexpected(TOKEN_ERROR_CORRUPT);

    const auto CLAIMS = glz::read_json<STokenClaims>(std::string{PLAINTEXT->begin(), PLAINTEXT->end()});
    if (!CLAIMS.has_value()) {
        Debug::log(ERR, "Session token passed authentication but its claims don't parse");
        return std::unexpected(TOKEN_ERROR_CORRUPT);
    }

    const STokenClaims& c = CLAIMS.value();

    if (c.v != TOKEN_CLAIMS_VERSION || !m_registry->get(c.network) || c.profile_id != CVerifiedIdentity::deriveProfileId(c.address, c.network))
        return std::unexpected(TOKEN_ERROR_CORRUPT);

    const auto EXPIRES_AT = NTimeUtils::fromEpochMs(c.expires_at);
    if (m_clock() >= EXPIRES_AT)
        return std::unexpected(TOKEN_ERROR_EXPIRED);

    if (m_denylist && m_denylist->isTokenRevoked(c.jti))
        return std::unexpected(TOKEN_ERROR_REVOKED);

    return SSession{
        .identity  = CVerifiedIdentity(c.address, c.network, NTimeUtils::fromEpochMs(c.issued_at), NTimeUtils::fromEpochMs(c.expiration_time)),
        .tokenId   = c.jti,
        .expiresAt = EXPIRES_AT,
    };
}
