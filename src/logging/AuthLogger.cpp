#include "AuthLogger.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <fmt/format.h>

#include "../debug/log.hpp"

CAuthLogger::CAuthLogger(const std::string& schema, const std::string& file) {
    size_t start = 0;
    while (start <= schema.size()) {
        auto end = schema.find(',', start);
        if (end == std::string::npos)
            end = schema.size();

        const auto CURR = std::string_view{schema}.substr(start, end - start);

        if (CURR == "epoch")
            m_logSchema.emplace_back(AUTH_LOG_EPOCH);
        else if (CURR == "ip")
            m_logSchema.emplace_back(AUTH_LOG_IP);
        else if (CURR == "address")
            m_logSchema.emplace_back(AUTH_LOG_ADDRESS);
        else if (CURR == "network")
            m_logSchema.emplace_back(AUTH_LOG_NETWORK);
        else if (CURR == "event")
            m_logSchema.emplace_back(AUTH_LOG_EVENT);
        else if (CURR == "result")
            m_logSchema.emplace_back(AUTH_LOG_RESULT);
        else if (!CURR.empty())
            Debug::log(WARN, "AuthLogger: unknown schema column \"{}\", ignoring", CURR);

        start = end + 1;
    }

    m_file.open(file, std::ios::app);

    if (!m_file.good())
        throw std::runtime_error(fmt::format("AuthLogger: bad file {}", file));
}

CAuthLogger::~CAuthLogger() {
    if (m_file.is_open())
        m_file.close();
}

// request-supplied values: no line breaks, quotes doubled
static std::string sanitize(const std::string& s) {
    if (s.empty())
        return s;

    std::string cpy = s;
    std::erase_if(cpy, [](char c) { return (unsigned char)c < 0x20 || c == 0x7f; });

    size_t pos = 0;
    while ((pos = cpy.find('"', pos)) != std::string::npos) {
        cpy.replace(pos, 1, "\"\"");
        pos += 2;
    }

    return cpy;
}

void CAuthLogger::logEvent(const SAuthEvent& event) {
    std::stringstream ss;

    for (const auto& t : m_logSchema) {
        switch (t) {
            case AUTH_LOG_EPOCH: {
                ss << fmt::format("{},", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
                break;
            }

            case AUTH_LOG_IP: ss << fmt::format("\"{}\",", sanitize(event.ip)); break;
            case AUTH_LOG_ADDRESS: ss << fmt::format("\"{}\",", sanitize(event.address)); break;
            case AUTH_LOG_NETWORK: ss << fmt::format("\"{}\",", sanitize(event.network)); break;
            case AUTH_LOG_EVENT: ss << fmt::format("{},", event.event); break;
            case AUTH_LOG_RESULT: ss << fmt::format("{},", event.result); break;
        }
    }

    std::string line = ss.str();
    if (line.empty())
        return;

    // replace , with \n
    line.back() = '\n';

    std::lock_guard<std::mutex> lg(m_fileMutex);
    m_file << line;
    m_file.flush();
}
