#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <expected>
#include <chrono>
#include <cstdint>

#include "Errors.hpp"
#include "Issuer.hpp"
#include "Verifier.hpp"
#include "Token.hpp"
#include "AddressValidator.hpp"
#include "../helpers/TimeUtils.hpp"

class CDatabase;
class CNetworkRegistry;

// one validated value, built once at startup
struct SAuthSettings {
    SChallengeSettings       challenge;
    std::string              secret          = "";
    std::chrono::seconds     sessionLifetime = std::chrono::seconds{0};
    std::vector<std::string> networks;
    std::string              storePath      = ":memory:";
    bool                     revokeOnLogout = false;
};

enum eSessionState : uint8_t {
    SESSION_UNAUTHENTICATED = 0,
    SESSION_AUTHENTICATED,
};

struct SSessionGrant {
    CVerifiedIdentity identity;
    std::string       token;
    TimePoint         tokenExpiresAt;
};

/*
    Unauthenticated --issueChallenge--> ChallengeIssued
    ChallengeIssued --verify ok--> Authenticated (token minted)
    ChallengeIssued --verify error--> Unauthenticated, a new challenge is needed
    Authenticated --token expired/corrupt/revoked, or logout--> Unauthenticated

    The server tracks none of these per client; the state is carried by the challenge
    in the store and by the token the client holds.
*/
class CSessionController {
  public:
    CSessionController(const SAuthSettings& settings, std::shared_ptr<IAddressValidator> validator = nullptr, ClockFn clock = NTimeUtils::systemClock());

    std::expected<SIssuedChallenge, eAuthError> issueChallenge(const std::string& address, const std::string& network);

    std::expected<SSessionGrant, eAuthError>    verify(const std::string& address, const std::string& network, const std::string& message, const std::string& signature);
    // same, with the address taken from the signed message
    std::expected<SSessionGrant, eAuthError>    verifyMessage(const std::string& network, const std::string& message, const std::string& signature);

    std::expected<SSession, eTokenError>        session(const std::string& token);

    // true if the token was put on the denylist; false means the logout is client-side only
    bool                                        logout(const std::string& token);

    eSessionState                               stateFor(const std::optional<std::string>& credential);

  private:
    SAuthSettings                       m_settings;
    std::shared_ptr<CNetworkRegistry>   m_registry;
    std::shared_ptr<CDatabase>          m_store;
    std::unique_ptr<CChallengeIssuer>   m_issuer;
    std::unique_ptr<CSignatureVerifier> m_verifier;
    std::unique_ptr<CSessionTokenCodec> m_codec;
};
