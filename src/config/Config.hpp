#pragma once

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

#include "../core/Session.hpp"

constexpr const char*  SECRET_ENV_VAR                   = "WALLETGATE_SECRET";
constexpr const char*  DB_FILE                          = "walletgate.db";
constexpr const size_t CONFIG_MIN_SECRET_LEN            = 32;
constexpr const size_t CONFIG_MAX_CHALLENGE_TIMEOUT_SEC = 24 * 60 * 60;
constexpr const size_t CONFIG_MAX_SESSION_LIFETIME_SEC  = 365 * 24 * 60 * 60;

class CConfigError : public std::runtime_error {
  public:
    CConfigError(const std::string& what) : std::runtime_error(what) {
        ;
    }
};

class CConfig {
  public:
    // throws CConfigError. Relative paths resolve against cwd.
    CConfig(const std::string& jsonc, const std::string& cwd = "");

    static CConfig fromFile(const std::string& path, const std::string& cwd);

    struct SConfig {
        int                      port                  = 3001;
        int                      threads               = 1;
        std::string              data_dir              = "";
        unsigned long int        max_request_size      = 65536;
        bool                     trace_logging         = false;
        std::string              domain                = "";
        std::string              uri                   = "";
        std::string              statement             = "Sign in with your wallet to prove you own this address.";
        std::string              version               = "1";
        unsigned long int        challenge_timeout_sec = 300; // 5 minutes
        unsigned long int        session_lifetime_sec  = 0;   // 0 = until the challenge expiration
        std::string              secret                = "";
        std::vector<std::string> networks              = {"solana-mainnet", "solana-devnet", "solana-testnet", "stellar-pubnet", "stellar-testnet"};
        std::string              cookie_name           = "walletgate-session";
        bool                     cookie_secure         = true;
        bool                     expose_token          = false;
        bool                     revoke_on_logout      = false;

        struct {
            std::string       endpoint   = "";
            std::string       api_key    = "";
            unsigned long int timeout_ms = 3000;
        } address_validation;

        struct {
            bool        log_auth_events = false;
            std::string auth_log_schema = "epoch,ip,address,network,event,result";
            std::string auth_log_file   = "";
        } logging;
    } m_config;

    SAuthSettings authSettings() const;
    std::string   storePath() const;

  private:
    std::string m_cwd;

    void        validate();
};

inline std::unique_ptr<CConfig> g_pConfig;
