#include "AuthApi.hpp"

#include "Session.hpp"
#include "../debug/log.hpp"
#include "../logging/AuthLogger.hpp"

#include <glaze/glaze.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>

struct SChallengeRequest {
    std::string address = "";
    std::string network = "";
};

struct SChallengeResponse {
    std::string message        = "";
    std::string nonce          = "";
    std::string expirationTime = "";
};

struct SVerifyRequest {
    std::string message   = "";
    std::string signature = "";
    std::string network   = "";
};

struct SVerifyResponse {
    std::string                address        = "";
    std::string                network        = "";
    std::string                profileId      = "";
    std::string                expirationTime = "";
    std::optional<std::string> token;
};

struct SSessionResponse {
    bool                       authenticated = false;
    std::optional<std::string> address;
    std::optional<std::string> network;
    std::optional<std::string> profileId;
    std::optional<std::string> expirationTime;
    std::optional<std::string> sessionExpiresAt;
};

struct SErrorResponse {
    std::string code = "";
};

template <typename T>
static std::string toJson(const T& v) {
    return glz::write_json(v).value_or("{}");
}

static SApiResponse errorResponse(int status, const std::string& code) {
    return SApiResponse{.status = status, .body = toJson(SErrorResponse{.code = code})};
}

static SApiResponse authErrorResponse(eAuthError e) {
    if (authErrorRetryable(e))
        Debug::log(WARN, "Request failed on a dependency: {}", authErrorName(e));

    return errorResponse(CAuthApi::statusFor(e), authErrorName(e));
}

static void audit(const SApiRequest& req, const std::string& address, const std::string& network, const char* event, const std::string& result) {
    if (!g_pAuthLogger)
        return;

    g_pAuthLogger->logEvent(SAuthEvent{.ip = req.ip, .address = address, .network = network, .event = event, .result = result});
}

CAuthApi::CAuthApi(std::shared_ptr<CSessionController> controller, const SApiSettings& settings, ClockFn clock) :
    m_controller(std::move(controller)), m_settings(settings), m_clock(std::move(clock)) {
    ;
}

const SApiSettings& CAuthApi::settings() const {
    return m_settings;
}

int CAuthApi::statusFor(eAuthError e) {
    switch (e) {
        case AUTH_ERROR_INVALID_ADDRESS:
        case AUTH_ERROR_UNSUPPORTED_NETWORK:
        case AUTH_ERROR_MALFORMED_MESSAGE:
        case AUTH_ERROR_TAMPERED_MESSAGE:
        case AUTH_ERROR_MALFORMED_SIGNATURE: return 400;
        case AUTH_ERROR_INVALID_SIGNATURE: return 401;
        case AUTH_ERROR_NOT_FOUND: return 404;
        case AUTH_ERROR_ALREADY_USED: return 409;
        case AUTH_ERROR_EXPIRED: return 410;
        case AUTH_ERROR_STORE_UNAVAILABLE:
        case AUTH_ERROR_DEPENDENCY_UNAVAILABLE: return 503;
    }

    return 500;
}

std::string CAuthApi::sessionCookie(const std::string& token, int64_t maxAgeSeconds) const {
    return fmt::format("{}={}; Path=/; HttpOnly; SameSite=Strict; Max-Age={}{}", m_settings.cookieName, token, maxAgeSeconds, m_settings.cookieSecure ? "; Secure" : "");
}

SApiResponse CAuthApi::challenge(const SApiRequest& req) {
    const auto REQUEST = glz::read_json<SChallengeRequest>(req.body);
    if (!REQUEST.has_value())
        return errorResponse(400, "BadRequest");

    const auto ISSUED = m_controller->issueChallenge(REQUEST->address, REQUEST->network);
    if (!ISSUED.has_value()) {
        audit(req, REQUEST->address, REQUEST->network, "challenge", authErrorName(ISSUED.error()));
        return authErrorResponse(ISSUED.error());
    }

    audit(req, REQUEST->address, REQUEST->network, "challenge", "ok");

    return SApiResponse{
        .status = 200,
        .body   = toJson(SChallengeResponse{
              .message        = ISSUED->message,
              .nonce          = ISSUED->challenge.nonce,
              .expirationTime = NTimeUtils::toIso8601(ISSUED->challenge.expirationTime),
        }),
    };
}

SApiResponse CAuthApi::verify(const SApiRequest& req) {
    const auto REQUEST = glz::read_json<SVerifyRequest>(req.body);
    if (!REQUEST.has_value())
        return errorResponse(400, "BadRequest");

    const auto GRANT = m_controller->verifyMessage(REQUEST->network, REQUEST->message, REQUEST->signature);
    if (!GRANT.has_value()) {
        audit(req, "", REQUEST->network, "verify", authErrorName(GRANT.error()));
        return authErrorResponse(GRANT.error());
    }

    const auto& IDENTITY = GRANT->identity;
    audit(req, IDENTITY.address(), IDENTITY.network(), "verify", "ok");

    const auto MAX_AGE = std::max<int64_t>(0, std::chrono::ceil<std::chrono::seconds>(GRANT->tokenExpiresAt - m_clock()).count());

    SVerifyResponse response{
        .address        = IDENTITY.address(),
        .network        = IDENTITY.network(),
        .profileId      = IDENTITY.profileId(),
        .expirationTime = NTimeUtils::toIso8601(IDENTITY.expirationTime()),
    };

    if (m_settings.exposeToken)
        response.token = GRANT->token;

    return SApiResponse{.status = 200, .body = toJson(response), .setCookie = sessionCookie(GRANT->token, MAX_AGE)};
}

SApiResponse CAuthApi::session(const SApiRequest& req) {
    if (!req.credential.has_value() || req.credential->empty())
        return SApiResponse{.status = 200, .body = toJson(SSessionResponse{})};

    const auto SESSION = m_controller->session(*req.credential);
    if (!SESSION.has_value()) {
        Debug::log(TRACE, "Session credential rejected: {}", tokenErrorName(SESSION.error()));
        audit(req, "", "", "session", tokenErrorName(SESSION.error()));
        return SApiResponse{.status = 200, .body = toJson(SSessionResponse{})};
    }

    const auto& IDENTITY = SESSION->identity;

    return SApiResponse{
        .status = 200,
        .body   = toJson(SSessionResponse{
              .authenticated    = true,
              .address          = IDENTITY.address(),
              .network          = IDENTITY.network(),
              .profileId        = IDENTITY.profileId(),
              .expirationTime   = NTimeUtils::toIso8601(IDENTITY.expirationTime()),
              .sessionExpiresAt = NTimeUtils::toIso8601(SESSION->expiresAt),
        }),
    };
}

SApiResponse CAuthApi::logout(const SApiRequest& req) {
    if (req.credential.has_value() && !req.credential->empty()) {
        const bool REVOKED = m_controller->logout(*req.credential);
        audit(req, "", "", "logout", REVOKED ? "revoked" : "ok");
    }

    return SApiResponse{.status = 200, .body = toJson(SSessionResponse{}), .setCookie = sessionCookie("", 0)};
}
