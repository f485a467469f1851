#include "Handler.hpp"
#include "../headers/customHeaders.hpp"
#include "../debug/log.hpp"
#include "../helpers/RequestUtils.hpp"

#include <fmt/format.h>

CServerHandler::CServerHandler(std::shared_ptr<CAuthApi> api) : m_api(api) {
    ;
}

bool CServerHandler::isResourceAuth(const std::string_view& res) {
    return res.starts_with("/auth/");
}

void CServerHandler::onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) {
    const auto  RESOURCE = req.resource();
    const auto  METHOD   = req.method();

    SApiRequest apiReq;
    apiReq.body       = req.body();
    apiReq.ip         = NRequestUtils::ipForRequest(req);
    apiReq.credential = NRequestUtils::credentialForRequest(req, m_api->settings().cookieName);

    Debug::log(TRACE, "Request: {} {} from {}", (uint32_t)METHOD, RESOURCE, apiReq.ip);

    if (!isResourceAuth(RESOURCE)) {
        send(response, SApiResponse{.status = 404, .body = R"({"code":"UnknownRoute"})"});
        return;
    }

    const auto methodNotAllowed = [&]() { send(response, SApiResponse{.status = 405, .body = R"({"code":"MethodNotAllowed"})"}); };

    if (RESOURCE == "/auth/challenge") {
        if (METHOD != Pistache::Http::Method::Post)
            return methodNotAllowed();
        send(response, m_api->challenge(apiReq));
    } else if (RESOURCE == "/auth/verify") {
        if (METHOD != Pistache::Http::Method::Post)
            return methodNotAllowed();
        send(response, m_api->verify(apiReq));
    } else if (RESOURCE == "/auth/session") {
        if (METHOD != Pistache::Http::Method::Get)
            return methodNotAllowed();
        send(response, m_api->session(apiReq));
    } else if (RESOURCE == "/auth/logout") {
        if (METHOD != Pistache::Http::Method::Post)
            return methodNotAllowed();
        send(response, m_api->logout(apiReq));
    } else
        send(response, SApiResponse{.status = 404, .body = R"({"code":"UnknownRoute"})"});
}

void CServerHandler::onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) {
    response.send(Pistache::Http::Code::Request_Timeout, R"({"code":"Timeout"})").then([=](ssize_t) {}, PrintException());
}

void CServerHandler::send(Pistache::Http::ResponseWriter& response, const SApiResponse& apiResponse) {
    if (apiResponse.setCookie)
        response.headers().add(std::make_shared<SetCookieHeader>(*apiResponse.setCookie));

    response.headers().add(std::make_shared<Pistache::Http::Header::CacheControl>(Pistache::Http::CacheDirective::NoStore));
    response.setMime(MIME(Application, Json));
    response.send(static_cast<Pistache::Http::Code>(apiResponse.status), apiResponse.body);
}
