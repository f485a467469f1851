#pragma once
#include <string>
#include <fmt/format.h>
#include <iostream>
#include <mutex>
#include <cstdlib>

enum LogLevel {
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    CRIT,
    INFO,
    TRACE
};

// Never pass secrets, raw signatures or full session tokens in here.
namespace Debug {
    inline bool       trace = false;
    inline std::mutex logMutex;

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {

        std::string logMsg = "";

        if (!trace && level == TRACE)
            return;

        switch (level) {
            case LOG: logMsg += "[LOG] "; break;
            case WARN: logMsg += "[WARN] "; break;
            case ERR: logMsg += "[ERR] "; break;
            case CRIT: logMsg += "[CRITICAL] "; break;
            case INFO: logMsg += "[INFO] "; break;
            case TRACE: logMsg += "[TRACE] "; break;
            default: break;
        }

        logMsg += fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        std::lock_guard<std::mutex> lg(logMutex);
        if (level == WARN || level == ERR || level == CRIT)
            std::cerr << logMsg << "\n";
        else
            std::cout << logMsg << "\n";
    }

    template <typename... Args>
    [[noreturn]] void die(fmt::format_string<Args...> fmt, Args&&... args) {
        const std::string logMsg = fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        {
            std::lock_guard<std::mutex> lg(logMutex);
            std::cerr << "[CRITICAL] " << logMsg << "\n";
        }
        exit(1);
    }
};
