#include <sstv/logger.h>
#include <sstv/error.h>

#include "gtest/gtest.h"

#include <sstream>

TEST(LoggerTest, WritesComponentTaggedLines) {
    std::ostringstream out;
    ConsoleLogger logger(LogLevel::DEBUG, out, false);

    logger.log(LogLevel::INFO, "TCPTransport", "Connected");
    logger.log(LogLevel::ERROR, "Authenticator", "Access denied");

    EXPECT_EQ("[TCPTransport] Connected\n[Authenticator] Access denied\n", out.str());
}

TEST(LoggerTest, DropsMessagesBelowMinimumLevel) {
    std::ostringstream out;
    ConsoleLogger logger(LogLevel::WARN, out, false);

    log_message(&logger, LogLevel::DEBUG, "X", "debug");
    log_message(&logger, LogLevel::INFO, "X", "info");
    log_message(&logger, LogLevel::WARN, "X", "warn");
    EXPECT_EQ("[X] warn\n", out.str());

    logger.set_min_level(LogLevel::DEBUG);
    log_message(&logger, LogLevel::DEBUG, "X", "debug");
    EXPECT_EQ("[X] warn\n[X] debug\n", out.str());
}

TEST(LoggerTest, ColoredOutputIsReset) {
    std::ostringstream out;
    ConsoleLogger logger(LogLevel::DEBUG, out, true);

    logger.log(LogLevel::ERROR, "X", "boom");
    std::string line = out.str();
    EXPECT_NE(std::string::npos, line.find("[X] boom"));
    EXPECT_EQ(0u, line.find("\033["));
    EXPECT_NE(std::string::npos, line.find("\033[0m\n"));
}

TEST(LoggerTest, NullLoggerIsIgnored) {
    log_message(nullptr, LogLevel::ERROR, "X", "nobody listens");
}

TEST(LoggerTest, NamesLevelsAndErrors) {
    EXPECT_STREQ("WARN", log_level_name(LogLevel::WARN));
    EXPECT_STREQ("ok", error_code_name(ErrorCode::OK));
    EXPECT_STREQ("access denied by remote device", error_code_name(ErrorCode::AUTH_DENIED));
}
