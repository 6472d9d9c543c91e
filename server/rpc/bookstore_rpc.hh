#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "../../common/message.hh"
#include "../storage/catalog_store.hh"
#include "folio.pb.h"

// Outcome of one dispatched request, ready to be framed.
struct RpcReply {
    uint32_t status = status::kOk;
    ContentType content_type = ContentType::ENVELOPE;
    std::string payload;
};

class BookStoreRpc {
public:
    explicit BookStoreRpc(std::shared_ptr<CatalogStore> store);
    ~BookStoreRpc() = default;

    // Application errors are embedded in the envelope (status 200). Unknown
    // tags and undecodable bodies produce a 400 with a plain-text body.
    void handle_rpc(uint64_t sender_id, uint32_t raw_message_type,
                    const std::string& message, RpcReply& reply);

private:
    std::shared_ptr<CatalogStore> store_;

    // RPC handlers
    void handleAddBooks(const std::string& message, RpcReply& reply);
    void handleAddCopies(const std::string& message, RpcReply& reply);
    void handleBuyBooks(const std::string& message, RpcReply& reply);
    void handleRateBooks(const std::string& message, RpcReply& reply);
    void handleRemoveBooks(const std::string& message, RpcReply& reply);
    void handleRemoveAllBooks(const std::string& message, RpcReply& reply);
    void handleUpdateEditorPicks(const std::string& message, RpcReply& reply);
    void handleListBooks(RpcReply& reply);
    void handleGetStockBooksByIsbn(const std::string& message, RpcReply& reply);
    void handleGetBooks(const std::string& message, RpcReply& reply);
    void handleGetEditorPicks(const std::string& message, RpcReply& reply);
    void handleGetTopRatedBooks(const std::string& message, RpcReply& reply);
    void handleGetBooksInDemand(RpcReply& reply);

    // utility
    template <typename RequestType>
    bool parse_request(const std::string& message, RequestType& request, RpcReply& reply);
    void respond(MessageType type, RpcReply& reply,
                 const std::function<void(Folio::Protocol::Response&)>& operation);
    static void reject(uint32_t status, const std::string& text, RpcReply& reply);
};
