#include "Verifier.hpp"

#include "Challenge.hpp"
#include "Crypto.hpp"
#include "Db.hpp"
#include "Network.hpp"
#include "../debug/log.hpp"

#include <fmt/format.h>

constexpr const char* PROFILE_ID_DOMAIN = "walletgate-profile-v1";

CVerifiedIdentity::CVerifiedIdentity(const std::string& address, const std::string& network, TimePoint issuedAt, TimePoint expirationTime) :
    m_address(address), m_network(network), m_profileId(deriveProfileId(address, network)), m_issuedAt(issuedAt), m_expirationTime(expirationTime) {
    ;
}

const std::string& CVerifiedIdentity::address() const {
    return m_address;
}

const std::string& CVerifiedIdentity::network() const {
    return m_network;
}

const std::string& CVerifiedIdentity::profileId() const {
    return m_profileId;
}

TimePoint CVerifiedIdentity::issuedAt() const {
    return m_issuedAt;
}

TimePoint CVerifiedIdentity::expirationTime() const {
    return m_expirationTime;
}

std::string CVerifiedIdentity::deriveProfileId(const std::string& address, const std::string& network) {
    return NCrypto::sha256Hex(fmt::format("{}:{}:{}", PROFILE_ID_DOMAIN, network, address)).substr(0, 32);
}

//

CSignatureVerifier::CSignatureVerifier(std::shared_ptr<CNetworkRegistry> registry, std::shared_ptr<CDatabase> store) :
    m_registry(std::move(registry)), m_store(std::move(store)) {
    ;
}

std::expected<CVerifiedIdentity, eAuthError> CSignatureVerifier::verify(const std::string& address, const std::string& network, const std::string& message,
                                                                        const std::string& signature) {
    const auto* SCHEME = m_registry->get(network);
    if (!SCHEME)
        return std::unexpected(AUTH_ERROR_UNSUPPORTED_NETWORK);

    // the parsed text is only trusted to locate the nonce
    const auto PARSED = NMessage::parse(message);
    if (!PARSED.has_value()) {
        Debug::log(TRACE, "verify: unparseable message for {} on {}", address, network);
        return std::unexpected(PARSED.error());
    }

    const auto CLAIMED = m_store->claimAndConsume(address, network, PARSED->nonce);
    if (!CLAIMED.has_value()) {
        Debug::log(TRACE, "verify: claim failed for {} on {}: {}", address, network, authErrorName(CLAIMED.error()));
        return std::unexpected(CLAIMED.error());
    }

    if (!NCrypto::constantTimeEquals(NMessage::compose(*CLAIMED), message)) {
        Debug::log(LOG, "verify: message for {} on {} does not match the issued challenge", address, network);
        return std::unexpected(AUTH_ERROR_TAMPERED_MESSAGE);
    }

    const auto SIG = SCHEME->decodeSignature(signature);
    if (!SIG.has_value())
        return std::unexpected(SIG.error());

    const auto KEY = SCHEME->deriveVerifyingKey(address);
    if (!KEY.has_value())
        return std::unexpected(AUTH_ERROR_INVALID_SIGNATURE);

    if (!SCHEME->verifySignature(*KEY, message, *SIG)) {
        Debug::log(LOG, "verify: bad signature for {} on {}", address, network);
        return std::unexpected(AUTH_ERROR_INVALID_SIGNATURE);
    }

    return CVerifiedIdentity(CLAIMED->address, CLAIMED->network, CLAIMED->issuedAt, CLAIMED->expirationTime);
}
