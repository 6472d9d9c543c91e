#include "tcp_server.hh"
#include "../../common/log.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <string>

TcpServer::TcpServer(uint16_t port, int backlog) : port_(port), backlog_(backlog) {}

TcpServer::~TcpServer() {
    stop();
    close_listener();
}

void TcpServer::close_listener() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    int fd = server_socket_.exchange(-1);
    if (fd >= 0) {
        close(fd);
    }
}

bool TcpServer::start() {
    if (server_socket_ >= 0) return true;
    LOG_INFO("Starting server on port %d", port_);
    stopping_ = false;
    return setup_and_listen();
}

void TcpServer::run() {
    if (server_socket_ < 0 && !start()) {
        return;
    }

    LOG_INFO("Server listening on port %d", port_);
    running_ = true;
    accept_clients();
    running_ = false;

    close_listener();
    LOG_INFO("Server on port %d stopped accepting", port_);
}

void TcpServer::stop() {
    if (stopping_.exchange(true)) {
        return;
    }

    std::map<uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        const int listener = server_socket_.load();
        if (listener >= 0) {
            // Wakes a blocked accept(); the descriptor is closed by run() or the destructor.
            shutdown(listener, SHUT_RDWR);
        }
        for (int fd : client_sockets_) {
            shutdown(fd, SHUT_RDWR);
        }
        threads.swap(client_threads_);
        finished_.clear();
    }
    for (auto& entry : threads) {
        if (entry.second.joinable()) entry.second.join();
    }
}

bool TcpServer::setup_and_listen() {
    // Create socket
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        int err = errno;
        LOG_ERROR("Failed to create socket: %s (errno=%d)", std::strerror(err), err);
        return false;
    }

    // Set SO_REUSEADDR option
    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_ERROR("Failed to set SO_REUSEADDR");
        close(fd);
        return false;
    }

    struct sockaddr_in server_addr;
    std::memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(port_);

    // Bind socket
    if (bind(fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        int err = errno;
        LOG_ERROR("Failed to bind port %d: %s", port_, std::strerror(err));
        close(fd);
        return false;
    }

    // Listen for connections
    if (listen(fd, backlog_) < 0) {
        LOG_ERROR("Failed to listen on socket");
        close(fd);
        return false;
    }

    // Report the port actually bound when an ephemeral one was requested
    socklen_t addr_len = sizeof(server_addr);
    if (getsockname(fd, (struct sockaddr*)&server_addr, &addr_len) == 0) {
        port_ = ntohs(server_addr.sin_port);
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    server_socket_ = fd;
    return true;
}

void TcpServer::accept_clients() {
    const int listener = server_socket_.load();
    uint64_t next_connection_id = 0;
    while (!stopping_) {
        struct sockaddr_in client_addr;
        socklen_t client_addr_len = sizeof(client_addr);

        int client_socket = accept(listener, (struct sockaddr*)&client_addr, &client_addr_len);
        if (client_socket < 0) {
            int err = errno;
            if (stopping_) break;
            LOG_ERROR("Failed to accept client connection: %s (errno=%d)",
                      std::strerror(err), err);
            if (err == EINTR) {
                continue;  // retry on interrupt
            }
            // Sleep briefly to avoid busy loop on persistent failure conditions
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        char ip_buffer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buffer, sizeof(ip_buffer));
        std::string client_ip(ip_buffer);

        std::lock_guard<std::mutex> lock(clients_mutex_);
        if (stopping_) {
            close(client_socket);
            break;
        }

        // Reap connection threads that have already finished
        for (uint64_t id : finished_) {
            auto it = client_threads_.find(id);
            if (it != client_threads_.end()) {
                it->second.join();
                client_threads_.erase(it);
            }
        }
        finished_.clear();

        const uint64_t connection_id = next_connection_id++;
        client_sockets_.insert(client_socket);
        LOG_INFO("Accepted connection fd=%d from %s (active=%zu)", client_socket, client_ip.c_str(),
                 client_sockets_.size());

        // Hand off each client to a dedicated thread
        client_threads_.emplace(connection_id, std::thread([this, client_socket, client_ip, connection_id]() {
            handle_client(client_socket);

            std::lock_guard<std::mutex> guard(clients_mutex_);
            client_sockets_.erase(client_socket);
            close(client_socket);
            finished_.push_back(connection_id);
            LOG_INFO("Closed connection fd=%d (%s) (active=%zu)", client_socket, client_ip.c_str(),
                     client_sockets_.size());
        }));
    }
}
