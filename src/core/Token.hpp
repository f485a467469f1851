#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <expected>
#include <cstdint>

#include "Errors.hpp"
#include "Verifier.hpp"
#include "../helpers/TimeUtils.hpp"

class CDatabase;
class CNetworkRegistry;

constexpr const char* TOKEN_PREFIX = "v1.";

struct SSession {
    CVerifiedIdentity identity;
    std::string       tokenId;
    TimePoint         expiresAt;
};

// Session tokens: "v1." + base64url(iv || AES-256-GCM(claims) || tag).
// The token is the session; the server keeps nothing per session except an optional denylist.
class CSessionTokenCodec {
  public:
    // throws if no key can be derived from secret
    CSessionTokenCodec(const std::string& secret, std::chrono::seconds sessionLifetime, std::shared_ptr<CNetworkRegistry> registry,
                       std::shared_ptr<CDatabase> denylist = nullptr, ClockFn clock = NTimeUtils::systemClock());

    // fresh IV per call. Error string is for logs only.
    std::expected<std::string, std::string> encode(const CVerifiedIdentity& identity);
    std::expected<SSession, eTokenError>    decode(const std::string& token);

    // when a token minted now would expire
    TimePoint                               expiryFor(const CVerifiedIdentity& identity) const;

  private:
    std::vector<uint8_t>              m_key;
    std::chrono::seconds              m_sessionLifetime;
    std::shared_ptr<CNetworkRegistry> m_registry;
    std::shared_ptr<CDatabase>        m_denylist;
    ClockFn                           m_clock;
};
