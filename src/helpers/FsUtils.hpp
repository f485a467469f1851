#pragma once

#include <string>
#include <expected>

namespace NFsUtils {
    bool                                    isAbsolute(const std::string& path);
    // path itself if absolute or if there is no cwd to resolve against
    std::string                             resolvePath(const std::string& path, const std::string& cwd);
    // error is a human readable reason
    std::expected<std::string, std::string> readFileAsString(const std::string& path);
};
