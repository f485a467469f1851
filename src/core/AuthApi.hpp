#pragma once

#include <string>
#include <memory>
#include <optional>

#include "Errors.hpp"
#include "../helpers/TimeUtils.hpp"

class CSessionController;

struct SApiRequest {
    std::string                body = "";
    std::optional<std::string> credential;
    std::string                ip = "";
};

struct SApiResponse {
    int                        status = 200;
    std::string                body   = "";
    std::optional<std::string> setCookie;
};

struct SApiSettings {
    std::string cookieName   = "walletgate-session";
    bool        cookieSecure = true;
    bool        exposeToken  = false;
};

// The /auth/* request/response contract, independent of the HTTP server.
class CAuthApi {
  public:
    CAuthApi(std::shared_ptr<CSessionController> controller, const SApiSettings& settings, ClockFn clock = NTimeUtils::systemClock());

    SApiResponse challenge(const SApiRequest& req);
    SApiResponse verify(const SApiRequest& req);
    SApiResponse session(const SApiRequest& req);
    SApiResponse logout(const SApiRequest& req);

    const SApiSettings& settings() const;

    static int          statusFor(eAuthError e);

  private:
    std::shared_ptr<CSessionController> m_controller;
    SApiSettings                        m_settings;
    ClockFn                             m_clock;

    std::string                         sessionCookie(const std::string& token, int64_t maxAgeSeconds) const;
};
