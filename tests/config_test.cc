#include <gtest/gtest.h>

#include <cstdlib>

#include "../common/config.hh"
#include "../common/log.h"
#include "test_util.hh"

TEST(ConfigTest, ParsesPorts) {
    EXPECT_EQ(config::parse_port("0"), 0);
    EXPECT_EQ(config::parse_port("8081"), 8081);
    EXPECT_EQ(config::parse_port("65535"), 65535);
    EXPECT_FOLIO_ERROR(config::parse_port("65536"), ErrorKind::INVALID_ARGUMENT);
    EXPECT_FOLIO_ERROR(config::parse_port("-1"), ErrorKind::INVALID_ARGUMENT);
    EXPECT_FOLIO_ERROR(config::parse_port("80x"), ErrorKind::INVALID_ARGUMENT);
    EXPECT_FOLIO_ERROR(config::parse_port(""), ErrorKind::INVALID_ARGUMENT);
}

TEST(ConfigTest, ClientDefaults) {
    unsetenv("FOLIO_HOST");
    unsetenv("FOLIO_PORT");
    unsetenv("FOLIO_TIMEOUT_MS");
    ClientConfig conf = ClientConfig::from_env();
    EXPECT_EQ(conf.host, "127.0.0.1");
    EXPECT_EQ(conf.port, 8081);
    EXPECT_EQ(conf.timeout_ms, 30000);
}

TEST(ConfigTest, EnvironmentOverrides) {
    setenv("FOLIO_HOST", "localhost", 1);
    setenv("FOLIO_PORT", "9100", 1);
    setenv("FOLIO_TIMEOUT_MS", "250", 1);
    setenv("FOLIO_BACKLOG", "16", 1);

    ClientConfig client = ClientConfig::from_env();
    EXPECT_EQ(client.host, "localhost");
    EXPECT_EQ(client.port, 9100);
    EXPECT_EQ(client.timeout_ms, 250);

    ServerConfig server = ServerConfig::from_env();
    EXPECT_EQ(server.port, 9100);
    EXPECT_EQ(server.backlog, 16);

    setenv("FOLIO_TIMEOUT_MS", "0", 1);
    EXPECT_FOLIO_ERROR(ClientConfig::from_env(), ErrorKind::INVALID_ARGUMENT);

    unsetenv("FOLIO_HOST");
    unsetenv("FOLIO_PORT");
    unsetenv("FOLIO_TIMEOUT_MS");
    unsetenv("FOLIO_BACKLOG");
}

TEST(ConfigTest, ParsesLogLevels) {
    Log::LogLevel level = Log::LogLevel::INFO;
    EXPECT_TRUE(Log::parseLogLevel("debug", level));
    EXPECT_EQ(level, Log::LogLevel::DEBUG);
    EXPECT_TRUE(Log::parseLogLevel("error", level));
    EXPECT_EQ(level, Log::LogLevel::ERROR);

    EXPECT_FALSE(Log::parseLogLevel("verbose", level));
    EXPECT_FALSE(Log::parseLogLevel("DEBUG", level));
    EXPECT_FALSE(Log::parseLogLevel("", level));
    EXPECT_EQ(level, Log::LogLevel::ERROR);
}
