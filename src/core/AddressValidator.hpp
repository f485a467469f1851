#pragma once

#include <string>
#include <expected>

#include "Errors.hpp"

// Delegated address/network check, used when an external service owns that decision.
// true: accepted, false: rejected, AUTH_ERROR_DEPENDENCY_UNAVAILABLE: could not ask.
class IAddressValidator {
  public:
    virtual ~IAddressValidator() = default;

    virtual std::expected<bool, eAuthError> validate(const std::string& address, const std::string& network) = 0;
};
