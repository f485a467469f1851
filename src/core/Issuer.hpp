#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <expected>

#include "Challenge.hpp"
#include "Errors.hpp"
#include "AddressValidator.hpp"
#include "../helpers/TimeUtils.hpp"

class CDatabase;
class CNetworkRegistry;

struct SChallengeSettings {
    std::string          domain    = "";
    std::string          uri       = "";
    std::string          statement = "";
    std::string          version   = CHALLENGE_MESSAGE_VERSION;
    std::chrono::seconds timeout   = std::chrono::seconds{300};
};

struct SIssuedChallenge {
    SChallenge  challenge;
    std::string message;
};

class CChallengeIssuer {
  public:
    CChallengeIssuer(const SChallengeSettings& settings, std::shared_ptr<CNetworkRegistry> registry, std::shared_ptr<CDatabase> store,
                     std::shared_ptr<IAddressValidator> validator = nullptr, ClockFn clock = NTimeUtils::systemClock());

    std::expected<SIssuedChallenge, eAuthError> issue(const std::string& address, const std::string& network);

  private:
    SChallengeSettings                 m_settings;
    std::shared_ptr<CNetworkRegistry>  m_registry;
    std::shared_ptr<CDatabase>         m_store;
    std::shared_ptr<IAddressValidator> m_validator;
    ClockFn                            m_clock;
};
