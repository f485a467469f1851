#pragma once

#include <string>
#include <optional>

#include <pistache/http.h>

namespace NRequestUtils {
    std::string                ipForRequest(const Pistache::Http::Request& req);
    // session cookie first, then "Authorization: Bearer"
    std::optional<std::string> credentialForRequest(const Pistache::Http::Request& req, const std::string& cookieName);
};
