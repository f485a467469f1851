#pragma once

#include <memory>

#include <pistache/http.h>

#include "AuthApi.hpp"

class CServerHandler : public Pistache::Http::Handler {

    HTTP_PROTOTYPE(CServerHandler)

  public:
    CServerHandler(std::shared_ptr<CAuthApi> api);

    void onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response);

    void onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response);

  private:
    void                      send(Pistache::Http::ResponseWriter& response, const SApiResponse& apiResponse);
    bool                      isResourceAuth(const std::string_view& res);

    std::shared_ptr<CAuthApi> m_api;
};
