#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

class TcpServer {
public:
    TcpServer(uint16_t port, int backlog = 128);
    virtual ~TcpServer();

    // Binds and listens. Port 0 picks an ephemeral port, see port().
    bool start();

    // Accepts clients until stop() is called. Calls start() if needed.
    void run();

    // Closes the listener, shuts down open connections and joins their threads.
    void stop();

    uint16_t port() const { return port_; }
    bool is_running() const { return running_.load(); }

protected:
    virtual void handle_client(int client_socket) = 0;

private:
    uint16_t port_;
    int backlog_;
    // Closed and shut down only under clients_mutex_, so stop() never
    // touches a descriptor number that run() has already released.
    std::atomic<int> server_socket_{-1};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex clients_mutex_;
    std::set<int> client_sockets_;
    std::map<uint64_t, std::thread> client_threads_;
    std::vector<uint64_t> finished_;

    bool setup_and_listen();
    void accept_clients();
    void close_listener();
};
