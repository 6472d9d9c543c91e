#include "folio_server.hh"
#include "../common/codec.hh"
#include "../common/log.h"

#include <string>

FolioServer::FolioServer(const ServerConfig& conf, std::shared_ptr<CatalogStore> store)
    : TcpServer(conf.port, conf.backlog), store_(std::move(store)) {}

FolioServer::~FolioServer() {
    // Connection threads call back into this object; finish them first.
    stop();
}

void FolioServer::init() {
    codec::verify_wire_schema();

    // Initialize components in dependency order
    if (!store_) {
        store_ = std::make_shared<CatalogStore>();
    }
    rpc_handler_ = std::make_shared<BookStoreRpc>(store_);
    LOG_INFO("Folio server initialized (schema=%u)", static_cast<unsigned>(codec::schema_fingerprint()));
}

void FolioServer::handle_client(int client_socket) {
    LOG_DEBUG("Handling client connection fd=%d", client_socket);
    const uint16_t schema = codec::schema_fingerprint();

    while (true) {
        MessageHeader request_header{};
        std::string payload;

        if (!MessageHandler::receive_message(client_socket, request_header, payload)) {
            if (request_header.payload_size > kMaxPayloadSize) {
                reject_oversized(client_socket, request_header);
            }
            return;  // Client disconnected or error
        }

        RpcReply reply;
        if (request_header.schema_version != schema) {
            LOG_WARNING("Rejecting request with schema %u (expected %u)",
                        static_cast<unsigned>(request_header.schema_version), static_cast<unsigned>(schema));
            reply.status = status::kBadRequest;
            reply.content_type = ContentType::TEXT;
            reply.payload = "Wire schema mismatch: client " + std::to_string(request_header.schema_version) +
                            ", server " + std::to_string(schema);
        } else {
            rpc_handler_->handle_rpc(request_header.sender_id, request_header.message_type, payload, reply);
        }

        MessageHeader response_header{};
        response_header.sender_id = request_header.sender_id;
        response_header.message_type = request_header.message_type;
        response_header.status = reply.status;
        response_header.content_type = static_cast<uint16_t>(reply.content_type);
        response_header.schema_version = schema;

        if (!MessageHandler::send_response(client_socket, response_header, reply.payload)) {
            return;  // Failed to send response
        }
    }
}

void FolioServer::reject_oversized(int client_socket, const MessageHeader& request_header) {
    // The body is never read, so the connection cannot be resynchronized;
    // answer once and let the caller close it.
    MessageHeader response_header{};
    response_header.sender_id = request_header.sender_id;
    response_header.message_type = request_header.message_type;
    response_header.status = status::kBadRequest;
    response_header.content_type = static_cast<uint16_t>(ContentType::TEXT);
    response_header.schema_version = codec::schema_fingerprint();
    const std::string text = "Payload of " + std::to_string(request_header.payload_size) +
                             " bytes exceeds the " + std::to_string(kMaxPayloadSize) + " byte limit";
    if (!MessageHandler::send_response(client_socket, response_header, text)) {
        LOG_WARNING("Could not report oversized frame to fd=%d", client_socket);
    }
}
