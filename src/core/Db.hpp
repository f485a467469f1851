#pragma once

#include <sqlite3.h>
#include <string>
#include <chrono>
#include <mutex>
#include <expected>

#include "Challenge.hpp"
#include "Errors.hpp"
#include "../helpers/TimeUtils.hpp"

constexpr const char* DB_IN_MEMORY = ":memory:";

// Pending challenges plus the optional session token denylist.
// Every call is serialized on one connection, which makes claimAndConsume the single
// point where concurrent verify attempts for the same nonce are decided.
class CDatabase {
  public:
    CDatabase(const std::string& path, ClockFn clock = NTimeUtils::systemClock());
    ~CDatabase();

    CDatabase(const CDatabase&)            = delete;
    CDatabase& operator=(const CDatabase&) = delete;

    // false if the nonce is already present
    std::expected<bool, eAuthError>       putChallenge(const SChallenge& challenge);

    // atomically marks the challenge used and returns it. Exactly one caller per nonce succeeds.
    std::expected<SChallenge, eAuthError> claimAndConsume(const std::string& address, const std::string& network, const std::string& nonce);

    bool                                  revokeToken(const std::string& tokenId, const TimePoint& expiresAt);

    // fails closed: a store error reports the token as revoked
    bool                                  isTokenRevoked(const std::string& tokenId);

  private:
    sqlite3*                              m_db = nullptr;
    ClockFn                               m_clock;
    std::mutex                            m_mutex;
    std::chrono::steady_clock::time_point m_lastDbCleanup = std::chrono::steady_clock::now();

    bool                                  exec(const char* sql);
    void                                  cleanupDb();
    bool                                  shouldCleanupDb();
};
