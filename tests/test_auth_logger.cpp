#include <gtest/gtest.h>
#include "logging/AuthLogger.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

static std::string readAll(const std::string& path) {
    std::ifstream     ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

class AuthLoggerTest : public ::testing::Test {
  protected:
    std::string path = (std::filesystem::temp_directory_path() / ("walletgate-auth-" + std::to_string(::getpid()) + ".csv")).string();

    void        TearDown() override {
        std::remove(path.c_str());
    }
};

TEST_F(AuthLoggerTest, WritesSchemaColumns) {
    {
        CAuthLogger logger("ip,network,event,result", path);
        logger.logEvent(SAuthEvent{.ip = "10.0.0.1", .address = "abc", .network = "solana-devnet", .event = "verify", .result = "ok"});
    }

    EXPECT_EQ(readAll(path), "\"10.0.0.1\",\"solana-devnet\",verify,ok\n");
}

TEST_F(AuthLoggerTest, SanitizesRequestValues) {
    {
        CAuthLogger logger("address", path);
        logger.logEvent(SAuthEvent{.address = "a\"b\nc"});
    }

    EXPECT_EQ(readAll(path), "\"a\"\"bc\"\n");
}

TEST_F(AuthLoggerTest, BadFileThrows) {
    EXPECT_THROW(CAuthLogger("ip", "/nonexistent-dir/auth.csv"), std::runtime_error);
}
