#include "RequestUtils.hpp"

#include <strings.h>

static std::optional<std::string> rawHeader(const Pistache::Http::Request& req, const char* name) {
    try {
        return req.headers().getRaw(name).value();
    } catch (std::exception& e) {
        ; // not present
    }

    return std::nullopt;
}

static std::string trim(const std::string& s) {
    const auto FIRST = s.find_first_not_of(" \t");
    if (FIRST == std::string::npos)
        return "";
    const auto LAST = s.find_last_not_of(" \t");
    return s.substr(FIRST, LAST - FIRST + 1);
}

std::string NRequestUtils::ipForRequest(const Pistache::Http::Request& req) {
    if (const auto CF = rawHeader(req, "cf-connecting-ip"); CF && !trim(*CF).empty())
        return trim(*CF);

    if (const auto REAL_IP = rawHeader(req, "X-Real-IP"); REAL_IP && !trim(*REAL_IP).empty())
        return trim(*REAL_IP);

    return req.address().host();
}

std::optional<std::string> NRequestUtils::credentialForRequest(const Pistache::Http::Request& req, const std::string& cookieName) {
    if (req.cookies().has(cookieName)) {
        const auto VALUE = req.cookies().get(cookieName).value;
        if (!VALUE.empty())
            return VALUE;
    }

    const auto AUTH = rawHeader(req, "Authorization");
    if (!AUTH)
        return std::nullopt;

    const auto VALUE = trim(*AUTH);
    if (VALUE.size() <= 7 || strncasecmp(VALUE.c_str(), "Bearer ", 7) != 0)
        return std::nullopt;

    return trim(VALUE.substr(7));
}
