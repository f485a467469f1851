#pragma once

#include <string>
#include <string_view>
#include <expected>

#include "Errors.hpp"
#include "../helpers/TimeUtils.hpp"

constexpr const char* CHALLENGE_MESSAGE_VERSION = "1";

struct SChallenge {
    std::string address   = "";
    std::string network   = "";
    std::string domain    = "";
    std::string uri       = "";
    std::string statement = "";
    std::string nonce     = "";
    std::string version   = CHALLENGE_MESSAGE_VERSION;
    TimePoint   issuedAt;
    TimePoint   expirationTime;

    bool        operator==(const SChallenge&) const = default;
};

// The canonical text a wallet signs. parse(compose(c)) == c for every c with fieldsValid(c).
namespace NMessage {
    std::string                           compose(const SChallenge& challenge);
    std::expected<SChallenge, eAuthError> parse(std::string_view message);

    bool                                  fieldsValid(const SChallenge& challenge);

    bool                                  validDomain(std::string_view domain);
    bool                                  validAddressToken(std::string_view address);
    bool                                  validStatement(std::string_view statement);
    bool                                  validUri(std::string_view uri);
    bool                                  validVersion(std::string_view version);
    bool                                  validNetworkName(std::string_view network);
    bool                                  validNonce(std::string_view nonce);

    // false if any field pattern was rejected by RE2
    bool                                  patternsCompiled();
};
