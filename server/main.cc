#include <csignal>
#include <cstring>
#include <string>
#include <thread>

#include "folio_server.hh"
#include "../common/errors.hh"
#include "../common/log.h"

namespace {

void PrintUsage(const char* program) {
    LOG_INFO("Usage: %s [--port N]", program);
}

}  // namespace

int main(int argc, char** argv) {
    LOG_INFO("Starting Folio server...");

    ServerConfig conf;
    try {
        conf = ServerConfig::from_env();
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
                conf.port = config::parse_port(argv[++i]);
            } else {
                PrintUsage(argv[0]);
                return 2;
            }
        }
    } catch (const FolioError& e) {
        LOG_ERROR("Invalid configuration: %s", e.what());
        return 2;
    }

    // Block termination signals before any thread exists; a dedicated
    // thread waits for them and stops the server.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    FolioServer server(conf);
    try {
        server.init();
    } catch (const FolioError& e) {
        LOG_FATAL("Initialization failed: %s", e.what());
    }

    if (!server.start()) {
        LOG_FATAL("Could not listen on port %d", conf.port);
    }

    std::thread signal_waiter([&server, &signals]() {
        int signal_number = 0;
        sigwait(&signals, &signal_number);
        LOG_INFO("Received signal %d, shutting down", signal_number);
        server.stop();
    });

    server.run();  // Start listening

    signal_waiter.join();
    LOG_INFO("Folio server shut down");
    return 0;
}
