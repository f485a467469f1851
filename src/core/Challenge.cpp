#include "Challenge.hpp"

#include <initializer_list>
#include <vector>

#include <fmt/format.h>
#include <re2/re2.h>

#include "../debug/log.hpp"

constexpr const char*  HEADER_SUFFIX          = " wants you to sign in with your wallet account:";
constexpr const char*  URI_PREFIX             = "URI: ";
constexpr const char*  VERSION_PREFIX         = "Version: ";
constexpr const char*  CHAIN_ID_PREFIX        = "Chain ID: ";
constexpr const char*  NONCE_PREFIX           = "Nonce: ";
constexpr const char*  ISSUED_AT_PREFIX       = "Issued At: ";
constexpr const char*  EXPIRATION_TIME_PREFIX = "Expiration Time: ";
constexpr const size_t MESSAGE_LINE_COUNT     = 11;

constexpr const size_t STATEMENT_MAX_LEN      = 1024;
constexpr const size_t URI_MAX_LEN            = 2048;

static const re2::RE2  DOMAIN_RE(R"([A-Za-z0-9](?:[A-Za-z0-9.\-]{0,252})(?::[0-9]{1,5})?)");
static const re2::RE2  ADDRESS_RE(R"([A-Za-z0-9]{1,128})");
// printable, single line. RE2 caps repetitions at 1000, length is checked separately
static const re2::RE2  STATEMENT_RE(R"([^\x00-\x1f\x7f]+)");
static const re2::RE2  URI_RE(R"([a-zA-Z][a-zA-Z0-9+.\-]*:[!-~]+)");
static const re2::RE2  VERSION_RE(R"([0-9A-Za-z.\-]{1,16})");
static const re2::RE2  NETWORK_RE(R"([a-z0-9\-]{1,64})");
static const re2::RE2  NONCE_RE(R"([A-Za-z0-9]{8,128})");

static bool fullMatch(std::string_view sv, const re2::RE2& re) {
    if (!re.ok()) {
        Debug::log(CRIT, "message pattern {} failed to compile: {}", re.pattern(), re.error());
        return false;
    }

    return RE2::FullMatch(re2::StringPiece{sv.data(), sv.size()}, re);
}

bool NMessage::patternsCompiled() {
    for (const auto* re : {&DOMAIN_RE, &ADDRESS_RE, &STATEMENT_RE, &URI_RE, &VERSION_RE, &NETWORK_RE, &NONCE_RE}) {
        if (!re->ok())
            return false;
    }

    return true;
}

bool NMessage::validDomain(std::string_view domain) {
    return fullMatch(domain, DOMAIN_RE);
}

bool NMessage::validAddressToken(std::string_view address) {
    return fullMatch(address, ADDRESS_RE);
}

bool NMessage::validStatement(std::string_view statement) {
    return statement.size() <= STATEMENT_MAX_LEN && fullMatch(statement, STATEMENT_RE);
}

bool NMessage::validUri(std::string_view uri) {
    return uri.size() <= URI_MAX_LEN && fullMatch(uri, URI_RE);
}

bool NMessage::validVersion(std::string_view version) {
    return fullMatch(version, VERSION_RE);
}

bool NMessage::validNetworkName(std::string_view network) {
    return fullMatch(network, NETWORK_RE);
}

bool NMessage::validNonce(std::string_view nonce) {
    return fullMatch(nonce, NONCE_RE);
}

bool NMessage::fieldsValid(const SChallenge& c) {
    return validDomain(c.domain) && validAddressToken(c.address) && validStatement(c.statement) && validUri(c.uri) && validVersion(c.version) &&
        validNetworkName(c.network) && validNonce(c.nonce) && c.issuedAt < c.expirationTime;
}

std::string NMessage::compose(const SChallenge& c) {
    return fmt::format("{}{}\n"
                       "{}\n"
                       "\n"
                       "{}\n"
                       "\n"
                       "{}{}\n"
                       "{}{}\n"
                       "{}{}\n"
                       "{}{}\n"
                       "{}{}\n"
                       "{}{}",
                       c.domain, HEADER_SUFFIX, c.address, c.statement, URI_PREFIX, c.uri, VERSION_PREFIX, c.version, CHAIN_ID_PREFIX, c.network, NONCE_PREFIX, c.nonce,
                       ISSUED_AT_PREFIX, NTimeUtils::toIso8601(c.issuedAt), EXPIRATION_TIME_PREFIX, NTimeUtils::toIso8601(c.expirationTime));
}

static std::vector<std::string_view> splitLines(std::string_view message) {
    std::vector<std::string_view> lines;
    size_t                        start = 0;
    while (true) {
        const auto NL = message.find('\n', start);
        if (NL == std::string_view::npos) {
            lines.emplace_back(message.substr(start));
            break;
        }
        lines.emplace_back(message.substr(start, NL - start));
        start = NL + 1;
    }
    return lines;
}

// strips prefix, returns false if the line doesn't carry it
static bool takeField(std::string_view line, std::string_view prefix, std::string_view& out) {
    if (!line.starts_with(prefix))
        return false;
    out = line.substr(prefix.size());
    return true;
}

std::expected<SChallenge, eAuthError> NMessage::parse(std::string_view message) {
    const auto LINES = splitLines(message);

    if (LINES.size() != MESSAGE_LINE_COUNT || !LINES[2].empty() || !LINES[4].empty())
        return std::unexpected(AUTH_ERROR_MALFORMED_MESSAGE);

    SChallenge       c;
    std::string_view header = LINES[0], uri, version, network, nonce, issuedAt, expirationTime;

    if (!header.ends_with(HEADER_SUFFIX))
        return std::unexpected(AUTH_ERROR_MALFORMED_MESSAGE);

    header.remove_suffix(std::string_view{HEADER_SUFFIX}.size());

    if (!takeField(LINES[5], URI_PREFIX, uri) || !takeField(LINES[6], VERSION_PREFIX, version) || !takeField(LINES[7], CHAIN_ID_PREFIX, network) ||
        !takeField(LINES[8], NONCE_PREFIX, nonce) || !takeField(LINES[9], ISSUED_AT_PREFIX, issuedAt) ||
        !takeField(LINES[10], EXPIRATION_TIME_PREFIX, expirationTime))
        return std::unexpected(AUTH_ERROR_MALFORMED_MESSAGE);

    const auto ISSUED  = NTimeUtils::fromIso8601(issuedAt);
    const auto EXPIRES = NTimeUtils::fromIso8601(expirationTime);

    if (!ISSUED || !EXPIRES)
        return std::unexpected(AUTH_ERROR_MALFORMED_MESSAGE);

    c.domain         = header;
    c.address        = LINES[1];
    c.statement      = LINES[3];
    c.uri            = uri;
    c.version        = version;
    c.network        = network;
    c.nonce          = nonce;
    c.issuedAt       = *ISSUED;
    c.expirationTime = *EXPIRES;

    if (!fieldsValid(c))
        return std::unexpected(AUTH_ERROR_MALFORMED_MESSAGE);

    return c;
}
