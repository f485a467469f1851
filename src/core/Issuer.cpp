#include "Issuer.hpp"

#include "Crypto.hpp"
#include "Db.hpp"
#include "Network.hpp"
#include "../debug/log.hpp"

constexpr const size_t NONCE_BYTES        = 16;
constexpr const int    NONCE_MAX_ATTEMPTS = 3;

CChallengeIssuer::CChallengeIssuer(const SChallengeSettings& settings, std::shared_ptr<CNetworkRegistry> registry, std::shared_ptr<CDatabase> store,
                                   std::shared_ptr<IAddressValidator> validator, ClockFn clock) :
    m_settings(settings), m_registry(std::move(registry)), m_store(std::move(store)), m_validator(std::move(validator)), m_clock(std::move(clock)) {
    ;
}

std::expected<SIssuedChallenge, eAuthError> CChallengeIssuer::issue(const std::string& address, const std::string& network) {
    const auto* SCHEME = m_registry->get(network);
    if (!SCHEME)
        return std::unexpected(AUTH_ERROR_UNSUPPORTED_NETWORK);

    if (!NMessage::validAddressToken(address) || !SCHEME->deriveVerifyingKey(address).has_value())
        return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);

    if (m_validator) {
        const auto RESULT = m_validator->validate(address, network);
        if (!RESULT.has_value())
            return std::unexpected(RESULT.error());
        if (!*RESULT) {
            Debug::log(LOG, "Address {} on {} rejected by the address validation service", address, network);
            return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);
        }
    }

    SChallenge c;
    c.address        = address;
    c.network        = network;
    c.domain         = m_settings.domain;
    c.uri            = m_settings.uri;
    c.statement      = m_settings.statement;
    c.version        = m_settings.version;
    c.issuedAt       = m_clock();
    c.expirationTime = c.issuedAt + m_settings.timeout;

    for (int attempt = 0; attempt < NONCE_MAX_ATTEMPTS; ++attempt) {
        const auto NONCE = NCrypto::randomHex(NONCE_BYTES);
        if (!NONCE)
            return std::unexpected(AUTH_ERROR_DEPENDENCY_UNAVAILABLE);

        c.nonce = *NONCE;

        const auto STORED = m_store->putChallenge(c);
        if (!STORED.has_value())
            return std::unexpected(STORED.error());

        if (*STORED) {
            Debug::log(TRACE, "Issued challenge for {} on {}, expires {}", address, network, NTimeUtils::toIso8601(c.expirationTime));
            return SIssuedChallenge{.challenge = c, .message = NMessage::compose(c)};
        }
    }

    Debug::log(ERR, "CChallengeIssuer::issue: could not find a free nonce after {} attempts", NONCE_MAX_ATTEMPTS);
    return std::unexpected(AUTH_ERROR_STORE_UNAVAILABLE);
}
