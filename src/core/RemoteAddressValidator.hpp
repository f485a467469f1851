#pragma once

#include <string>
#include <chrono>

#include "AddressValidator.hpp"

// Asks an external HTTP service whether an address may sign in.
// POST {"address","network"} -> {"valid": bool}
class CRemoteAddressValidator : public IAddressValidator {
  public:
    CRemoteAddressValidator(const std::string& endpoint, const std::string& apiKey, std::chrono::milliseconds timeout);

    virtual std::expected<bool, eAuthError> validate(const std::string& address, const std::string& network) override;

  private:
    std::string               m_endpoint = "";
    std::string               m_apiKey   = "";
    std::chrono::milliseconds m_timeout;
};
