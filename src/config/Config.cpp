#include "Config.hpp"

#include <algorithm>
#include <cstdlib>

#include <glaze/glaze.hpp>
#include <fmt/format.h>

#include "../core/Challenge.hpp"
#include "../core/Network.hpp"
#include "../core/Db.hpp"
#include "../helpers/FsUtils.hpp"

CConfig::CConfig(const std::string& jsonc, const std::string& cwd) : m_cwd(cwd) {
    auto json = glz::read_jsonc<SConfig>(jsonc);

    if (!json.has_value())
        throw CConfigError(fmt::format("config has bad format: {}", glz::format_error(json.error(), jsonc)));

    m_config = json.value();

    if (const char* env = std::getenv(SECRET_ENV_VAR); env && *env)
        m_config.secret = env;

    validate();
}

CConfig CConfig::fromFile(const std::string& path, const std::string& cwd) {
    const auto FULL_PATH = NFsUtils::resolvePath(path, cwd);
    const auto CONTENTS  = NFsUtils::readFileAsString(FULL_PATH);

    if (!CONTENTS.has_value())
        throw CConfigError(fmt::format("cannot read config at {}: {}", FULL_PATH, CONTENTS.error()));

    return CConfig(*CONTENTS, cwd);
}

void CConfig::validate() {
    if (!NMessage::patternsCompiled() || !NTimeUtils::patternsCompiled())
        throw CConfigError("internal message patterns failed to compile");

    // never echo the secret itself
    if (m_config.secret.empty())
        throw CConfigError(fmt::format("secret is required (set it in the config or via {})", SECRET_ENV_VAR));

    if (m_config.secret.size() < CONFIG_MIN_SECRET_LEN)
        throw CConfigError(fmt::format("secret must be at least {} bytes long", CONFIG_MIN_SECRET_LEN));

    if (m_config.domain.empty())
        throw CConfigError("domain is required");

    if (!NMessage::validDomain(m_config.domain))
        throw CConfigError(fmt::format("domain \"{}\" is not a valid host[:port]", m_config.domain));

    if (m_config.uri.empty())
        throw CConfigError("uri is required");

    if (!NMessage::validUri(m_config.uri))
        throw CConfigError(fmt::format("uri \"{}\" is not a valid absolute uri", m_config.uri));

    if (!NMessage::validStatement(m_config.statement))
        throw CConfigError("statement must be non-empty printable text on a single line");

    if (!NMessage::validVersion(m_config.version))
        throw CConfigError(fmt::format("version \"{}\" is invalid", m_config.version));

    if (m_config.challenge_timeout_sec == 0)
        throw CConfigError("challenge_timeout_sec must be greater than zero");

    if (m_config.challenge_timeout_sec > CONFIG_MAX_CHALLENGE_TIMEOUT_SEC)
        throw CConfigError(fmt::format("challenge_timeout_sec must be at most {}", CONFIG_MAX_CHALLENGE_TIMEOUT_SEC));

    if (m_config.session_lifetime_sec > CONFIG_MAX_SESSION_LIFETIME_SEC)
        throw CConfigError(fmt::format("session_lifetime_sec must be at most {}", CONFIG_MAX_SESSION_LIFETIME_SEC));

    if (m_config.port <= 0 || m_config.port > 65535)
        throw CConfigError(fmt::format("port {} is out of range", m_config.port));

    if (m_config.threads <= 0)
        throw CConfigError("threads must be greater than zero");

    if (m_config.networks.empty())
        throw CConfigError("at least one network must be enabled");

    const auto KNOWN = CNetworkRegistry::knownNetworks();
    for (const auto& n : m_config.networks) {
        if (std::find(KNOWN.begin(), KNOWN.end(), n) == KNOWN.end())
            throw CConfigError(fmt::format("unsupported network \"{}\"", n));
    }

    if (m_config.cookie_name.empty() || m_config.cookie_name.find_first_of("=;, \t") != std::string::npos)
        throw CConfigError("cookie_name is invalid");

    if (!m_config.address_validation.endpoint.empty() && m_config.address_validation.api_key.empty())
        throw CConfigError("address_validation.endpoint requires address_validation.api_key");

    if (m_config.logging.log_auth_events && m_config.logging.auth_log_file.empty())
        throw CConfigError("logging.log_auth_events requires logging.auth_log_file");
}

std::string CConfig::storePath() const {
    if (m_config.data_dir.empty())
        return DB_IN_MEMORY;

    return NFsUtils::resolvePath(m_config.data_dir, m_cwd) + "/" + DB_FILE;
}

SAuthSettings CConfig::authSettings() const {
    SAuthSettings s;
    s.challenge.domain    = m_config.domain;
    s.challenge.uri       = m_config.uri;
    s.challenge.statement = m_config.statement;
    s.challenge.version   = m_config.version;
    s.challenge.timeout   = std::chrono::seconds{m_config.challenge_timeout_sec};
    s.secret              = m_config.secret;
    s.sessionLifetime     = std::chrono::seconds{m_config.session_lifetime_sec};
    s.networks            = m_config.networks;
    s.storePath           = storePath();
    s.revokeOnLogout      = m_config.revoke_on_logout;
    return s;
}
