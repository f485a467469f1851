#include "FsUtils.hpp"

#include <fstream>
#include <cerrno>
#include <cstring>

bool NFsUtils::isAbsolute(const std::string& path) {
    return !path.empty() && (path.front() == '/' || path.front() == '~');
}

std::string NFsUtils::resolvePath(const std::string& path, const std::string& cwd) {
    if (isAbsolute(path) || cwd.empty())
        return path;
    return cwd + "/" + path;
}

std::expected<std::string, std::string> NFsUtils::readFileAsString(const std::string& path) {
    errno = 0;
    std::ifstream ifs(path);
    if (!ifs.good())
        return std::unexpected(errno ? std::strerror(errno) : "cannot open");
    auto res = std::string((std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>()));
    if (!res.empty() && res.back() == '\n')
        res.pop_back();
    return res;
}
