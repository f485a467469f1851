#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <mutex>
#include <fstream>

struct SAuthEvent {
    std::string ip      = "";
    std::string address = "";
    std::string network = "";
    std::string event   = ""; // challenge, verify, session, logout
    std::string result  = ""; // ok or an error code
};

// Appends one CSV line per protocol event, columns picked by the schema.
class CAuthLogger {
  public:
    CAuthLogger(const std::string& schema, const std::string& file);
    ~CAuthLogger();

    void logEvent(const SAuthEvent& event);

  private:
    enum eAuthLoggerProps : uint8_t {
        AUTH_LOG_EPOCH = 0,
        AUTH_LOG_IP,
        AUTH_LOG_ADDRESS,
        AUTH_LOG_NETWORK,
        AUTH_LOG_EVENT,
        AUTH_LOG_RESULT,
    };

    std::vector<eAuthLoggerProps> m_logSchema;
    std::ofstream                 m_file;
    std::mutex                    m_fileMutex;
};

inline std::unique_ptr<CAuthLogger> g_pAuthLogger;
