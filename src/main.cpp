#include <iostream>
#include <filesystem>
#include <algorithm>
#include <pistache/common.h>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/net.h>

#include "debug/log.hpp"

#include "core/Handler.hpp"
#include "core/AuthApi.hpp"
#include "core/Session.hpp"
#include "core/RemoteAddressValidator.hpp"

#include "config/Config.hpp"

#include "logging/AuthLogger.hpp"

#include <signal.h>

#ifndef WALLETGATE_VERSION
#define WALLETGATE_VERSION "unknown"
#endif

// SIGINT/SIGTERM/SIGQUIT end the process, SIGPIPE and SIGALRM are swallowed
static bool blockShutdownSignals(sigset_t& signals) {
    if (sigemptyset(&signals) != 0)
        return false;

    for (const int SIG : {SIGTERM, SIGINT, SIGQUIT, SIGPIPE, SIGALRM}) {
        if (sigaddset(&signals, SIG) != 0)
            return false;
    }

    return sigprocmask(SIG_BLOCK, &signals, nullptr) == 0;
}

static void waitForShutdown(sigset_t& signals) {
    while (true) {
        int       number = 0;
        const int STATUS = sigwait(&signals, &number);
        if (STATUS != 0) {
            Debug::log(CRIT, "sigwait failed with {}", STATUS);
            return;
        }

        Debug::log(TRACE, "Caught signal {}", number);

        if (number == SIGINT || number == SIGTERM || number == SIGQUIT)
            return;
    }
}

int main(int argc, char** argv, char** envp) {

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    const std::string cwd        = std::filesystem::current_path();
    std::string       configPath = "config.jsonc";

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i] == "--help" || ARGS[i] == "-h") {
            std::cout << "walletgate " << WALLETGATE_VERSION << "\n-c, --config [path]  config file (default: ./config.jsonc)\n-h, --help           show this\n";
            return 0;
        } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
            configPath = ARGS[i + 1];
            i++;
        } else {
            std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
            continue;
        }
    }

    try {
        g_pConfig = std::make_unique<CConfig>(CConfig::fromFile(configPath, cwd));
    } catch (CConfigError& e) { Debug::die("Invalid config {}: {}", configPath, e.what()); }

    Debug::trace = g_pConfig->m_config.trace_logging;

    if (g_pConfig->m_config.logging.log_auth_events) {
        try {
            g_pAuthLogger = std::make_unique<CAuthLogger>(g_pConfig->m_config.logging.auth_log_schema, g_pConfig->m_config.logging.auth_log_file);
        } catch (std::exception& e) { Debug::die("Couldn't start the auth logger: {}", e.what()); }
    }

    std::shared_ptr<IAddressValidator> validator;
    if (!g_pConfig->m_config.address_validation.endpoint.empty()) {
        validator = std::make_shared<CRemoteAddressValidator>(g_pConfig->m_config.address_validation.endpoint, g_pConfig->m_config.address_validation.api_key,
                                                              std::chrono::milliseconds(g_pConfig->m_config.address_validation.timeout_ms));
        Debug::log(LOG, "Delegating address validation to {}", g_pConfig->m_config.address_validation.endpoint);
    }

    std::shared_ptr<CSessionController> controller;
    try {
        controller = std::make_shared<CSessionController>(g_pConfig->authSettings(), validator);
    } catch (std::exception& e) { Debug::die("Couldn't initialize: {}", e.what()); }

    auto api = std::make_shared<CAuthApi>(controller,
                                          SApiSettings{
                                              .cookieName   = g_pConfig->m_config.cookie_name,
                                              .cookieSecure = g_pConfig->m_config.cookie_secure,
                                              .exposeToken  = g_pConfig->m_config.expose_token,
                                          });

    sigset_t signals;
    if (!blockShutdownSignals(signals))
        Debug::die("Couldn't block signals");

    Pistache::Address address = {Pistache::Ipv4::any(), (uint16_t)g_pConfig->m_config.port};
    Debug::log(LOG, "walletgate {} starting on {}:{}", WALLETGATE_VERSION, address.host(), address.port().toString());

    auto endpoint = std::make_unique<Pistache::Http::Endpoint>(address);
    auto opts     = Pistache::Http::Endpoint::options()
                    .threads(std::max(1, g_pConfig->m_config.threads))
                    .flags(Pistache::Tcp::Options::ReuseAddr | Pistache::Tcp::Options::ReusePort);
    opts.maxRequestSize(g_pConfig->m_config.max_request_size);
    endpoint->init(opts);
    auto handler = Pistache::Http::make_handler<CServerHandler>(api);
    endpoint->setHandler(handler);

    endpoint->serveThreaded();

    waitForShutdown(signals);

    sigprocmask(SIG_UNBLOCK, &signals, nullptr);

    Debug::log(LOG, "Shutting down, bye!");

    endpoint->shutdown();
    endpoint = nullptr;

    return 0;
}
