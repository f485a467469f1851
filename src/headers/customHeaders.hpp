#pragma once

#include <string>

#include <pistache/http_headers.h>
#include <pistache/net.h>

class SetCookieHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Set-Cookie");

    SetCookieHeader(const std::string& cookie = "") : m_cookie(cookie) {
        ;
    }

    void parse(const std::string& str) override {
        m_cookie = str;
    }

    void write(std::ostream& os) const override {
        os << m_cookie;
    }

  private:
    std::string m_cookie = "";
};

// sent to the delegated address validation service
class ApiKeyHeader : public Pistache::Http::Header::Header {
  public:
    NAME("X-API-Key");

    ApiKeyHeader(const std::string& key = "") : m_key(key) {
        ;
    }

    void parse(const std::string& str) override {
        m_key = str;
    }

    void write(std::ostream& os) const override {
        os << m_key;
    }

  private:
    std::string m_key = "";
};
