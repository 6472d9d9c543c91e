#pragma once

#include <cstdint>
#include <string>

// Settings come from FOLIO_* environment variables; main() may override
// them from the command line.

struct ServerConfig {
    uint16_t port = 8081;
    int backlog = 128;

    static ServerConfig from_env();
};

struct ClientConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8081;
    int timeout_ms = 30000;

    static ClientConfig from_env();
};

namespace config {

// Throws FolioError (INVALID_ARGUMENT) when the value is not a valid port.
uint16_t parse_port(const std::string& value);

// Throws FolioError (INVALID_ARGUMENT) unless min <= value <= max.
int parse_int(const char* name, const std::string& value, int min, int max);

}  // namespace config
