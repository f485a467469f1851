#include "Session.hpp"

#include "Challenge.hpp"
#include "Db.hpp"
#include "Network.hpp"
#include "../debug/log.hpp"

CSessionController::CSessionController(const SAuthSettings& settings, std::shared_ptr<IAddressValidator> validator, ClockFn clock) : m_settings(settings) {
    m_registry = CNetworkRegistry::fromNames(m_settings.networks);
    m_store    = std::make_shared<CDatabase>(m_settings.storePath, clock);
    m_issuer   = std::make_unique<CChallengeIssuer>(m_settings.challenge, m_registry, m_store, std::move(validator), clock);
    m_verifier = std::make_unique<CSignatureVerifier>(m_registry, m_store);
    m_codec    = std::make_unique<CSessionTokenCodec>(m_settings.secret, m_settings.sessionLifetime, m_registry, m_settings.revokeOnLogout ? m_store : nullptr, clock);
}

std::expected<SIssuedChallenge, eAuthError> CSessionController::issueChallenge(const std::string& address, const std::string& network) {
    return m_issuer->issue(address, network);
}

std::expected<SSessionGrant, eAuthError> CSessionController::verify(const std::string& address, const std::string& network, const std::string& message,
                                                                   const std::string& signature) {
    auto identity = m_verifier->verify(address, network, message, signature);
    if (!identity.has_value())
        return std::unexpected(identity.error());

    const auto TOKEN = m_codec->encode(*identity);
    if (!TOKEN.has_value()) {
        Debug::log(ERR, "Verified {} on {} but could not mint a session token: {}", address, network, TOKEN.error());
        return std::unexpected(AUTH_ERROR_DEPENDENCY_UNAVAILABLE);
    }

    Debug::log(LOG, "Authenticated {} on {} (profile {})", identity->address(), identity->network(), identity->profileId());

    return SSessionGrant{.identity = *identity, .token = *TOKEN, .tokenExpiresAt = m_codec->expiryFor(*identity)};
}

std::expected<SSessionGrant, eAuthError> CSessionController::verifyMessage(const std::string& network, const std::string& message, const std::string& signature) {
    const auto PARSED = NMessage::parse(message);
    if (!PARSED.has_value())
        return std::unexpected(PARSED.error());

    return verify(PARSED->address, network, message, signature);
}

std::expected<SSession, eTokenError> CSessionController::session(const std::string& token) {
    return m_codec->decode(token);
}

bool CSessionController::logout(const std::string& token) {
    if (!m_settings.revokeOnLogout)
        return false;

    const auto SESSION = m_codec->decode(token);
    if (!SESSION.has_value())
        return false;

    if (!m_store->revokeToken(SESSION->tokenId, SESSION->expiresAt)) {
        Debug::log(ERR, "Failed to revoke session token {}", SESSION->tokenId);
        return false;
    }

    Debug::log(LOG, "Revoked session token {} for {} on {}", SESSION->tokenId, SESSION->identity.address(), SESSION->identity.network());
    return true;
}

eSessionState CSessionController::stateFor(const std::optional<std::string>& credential) {
    if (!credential.has_value() || credential->empty())
        return SESSION_UNAUTHENTICATED;

    return m_codec->decode(*credential).has_value() ? SESSION_AUTHENTICATED : SESSION_UNAUTHENTICATED;
}
