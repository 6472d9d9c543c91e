#include "config.hh"
#include "errors.hh"

#include <cstdlib>
#include <limits>

namespace {

const char* GetEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env && env[0] != '\0') {
        return env;
    }
    return nullptr;
}

}  // namespace

namespace config {

int parse_int(const char* name, const std::string& value, int min, int max) {
    size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw FolioError::invalid_argument(std::string(name) + " is not a number: '" + value + "'");
    }
    if (consumed != value.size() || parsed < min || parsed > max) {
        throw FolioError::invalid_argument(std::string(name) + " out of range [" + std::to_string(min) +
                                           ", " + std::to_string(max) + "]: '" + value + "'");
    }
    return static_cast<int>(parsed);
}

uint16_t parse_port(const std::string& value) {
    return static_cast<uint16_t>(parse_int("port", value, 0, std::numeric_limits<uint16_t>::max()));
}

}  // namespace config

ServerConfig ServerConfig::from_env() {
    ServerConfig conf;
    if (const char* port = GetEnv("FOLIO_PORT")) {
        conf.port = config::parse_port(port);
    }
    if (const char* backlog = GetEnv("FOLIO_BACKLOG")) {
        conf.backlog = config::parse_int("FOLIO_BACKLOG", backlog, 1, 65535);
    }
    return conf;
}

ClientConfig ClientConfig::from_env() {
    ClientConfig conf;
    if (const char* host = GetEnv("FOLIO_HOST")) {
        conf.host = host;
    }
    if (const char* port = GetEnv("FOLIO_PORT")) {
        conf.port = config::parse_port(port);
    }
    if (const char* timeout = GetEnv("FOLIO_TIMEOUT_MS")) {
        conf.timeout_ms = config::parse_int("FOLIO_TIMEOUT_MS", timeout, 1, 3600 * 1000);
    }
    return conf;
}
