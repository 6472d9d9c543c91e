#pragma once

#include <memory>

#include "../common/config.hh"
#include "network/tcp_server.hh"
#include "network/message_handler.hh"
#include "rpc/bookstore_rpc.hh"
#include "storage/catalog_store.hh"

class FolioServer : public TcpServer {
public:
    explicit FolioServer(const ServerConfig& conf,
                         std::shared_ptr<CatalogStore> store = nullptr);
    ~FolioServer() override;

    // Verifies the wire schema and creates the store when none was given.
    void init();

    std::shared_ptr<CatalogStore> store() const { return store_; }

protected:
    void handle_client(int client_socket) override;

private:
    void reject_oversized(int client_socket, const MessageHeader& request_header);

    // Core components
    std::shared_ptr<CatalogStore> store_;
    std::shared_ptr<BookStoreRpc> rpc_handler_;
};
