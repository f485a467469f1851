#pragma once

#include <string>
#include <memory>
#include <expected>

#include "Errors.hpp"
#include "../helpers/TimeUtils.hpp"

class CDatabase;
class CNetworkRegistry;

// Who proved key ownership, and until when. Only a successful verification or a
// valid session token can produce one.
class CVerifiedIdentity {
  public:
    const std::string& address() const;
    const std::string& network() const;
    const std::string& profileId() const;
    TimePoint          issuedAt() const;
    TimePoint          expirationTime() const;

    bool               operator==(const CVerifiedIdentity&) const = default;

    // deterministic per (address, network), stable across sessions
    static std::string deriveProfileId(const std::string& address, const std::string& network);

  private:
    CVerifiedIdentity(const std::string& address, const std::string& network, TimePoint issuedAt, TimePoint expirationTime);

    std::string m_address, m_network, m_profileId;
    TimePoint   m_issuedAt, m_expirationTime;

    friend class CSignatureVerifier;
    friend class CSessionTokenCodec;
};

class CSignatureVerifier {
  public:
    CSignatureVerifier(std::shared_ptr<CNetworkRegistry> registry, std::shared_ptr<CDatabase> store);

    // Every failure is terminal for the nonce: once claimed, a challenge never returns to the pool.
    std::expected<CVerifiedIdentity, eAuthError> verify(const std::string& address, const std::string& network, const std::string& message, const std::string& signature);

  private:
    std::shared_ptr<CNetworkRegistry> m_registry;
    std::shared_ptr<CDatabase>        m_store;
};
