#include "bookstore_rpc.hh"
#include "../../common/codec.hh"
#include "../../common/errors.hh"
#include "../../common/log.h"

#include <chrono>
#include <exception>
#include <vector>

BookStoreRpc::BookStoreRpc(std::shared_ptr<CatalogStore> store)
    : store_(std::move(store)) {
}

void BookStoreRpc::handle_rpc(uint64_t sender_id, uint32_t raw_message_type,
                              const std::string& message, RpcReply& reply) {
    LOG_DEBUG("Handling RPC: sender_id=%lu, message_type=%u", sender_id, raw_message_type);

    if (!IsKnownMessageType(raw_message_type)) {
        LOG_ERROR("Unknown message type: %u", raw_message_type);
        reject(status::kBadRequest, "Unknown message type " + std::to_string(raw_message_type), reply);
        return;
    }

    switch (static_cast<MessageType>(raw_message_type)) {
        case MessageType::ADD_BOOKS:
            handleAddBooks(message, reply);
            return;
        case MessageType::ADD_COPIES:
            handleAddCopies(message, reply);
            return;
        case MessageType::BUY_BOOKS:
            handleBuyBooks(message, reply);
            return;
        case MessageType::RATE_BOOKS:
            handleRateBooks(message, reply);
            return;
        case MessageType::REMOVE_BOOKS:
            handleRemoveBooks(message, reply);
            return;
        case MessageType::REMOVE_ALL_BOOKS:
            handleRemoveAllBooks(message, reply);
            return;
        case MessageType::UPDATE_EDITOR_PICKS:
            handleUpdateEditorPicks(message, reply);
            return;
        case MessageType::LIST_BOOKS:
            handleListBooks(reply);
            return;
        case MessageType::GET_STOCK_BOOKS_BY_ISBN:
            handleGetStockBooksByIsbn(message, reply);
            return;
        case MessageType::GET_BOOKS:
            handleGetBooks(message, reply);
            return;
        case MessageType::GET_EDITOR_PICKS:
            handleGetEditorPicks(message, reply);
            return;
        case MessageType::GET_TOP_RATED_BOOKS:
            handleGetTopRatedBooks(message, reply);
            return;
        case MessageType::GET_BOOKS_IN_DEMAND:
            handleGetBooksInDemand(reply);
            return;
        default:
            LOG_ERROR("Unhandled message type: %u", raw_message_type);
            reject(status::kBadRequest, "Unhandled message type " + std::to_string(raw_message_type), reply);
            return;
    }
}

template <typename RequestType>
bool BookStoreRpc::parse_request(const std::string& message, RequestType& request, RpcReply& reply) {
    if (!request.ParseFromString(message)) {
        LOG_WARNING("Failed to parse %s", RequestType::descriptor()->full_name().c_str());
        reject(status::kBadRequest, "Malformed " + RequestType::descriptor()->full_name(), reply);
        return false;
    }
    return true;
}

void BookStoreRpc::reject(uint32_t status, const std::string& text, RpcReply& reply) {
    reply.status = status;
    reply.content_type = ContentType::TEXT;
    reply.payload = text;
}

void BookStoreRpc::respond(MessageType type, RpcReply& reply,
                           const std::function<void(Folio::Protocol::Response&)>& operation) {
    Folio::Protocol::Response response;
    const auto exec_start = std::chrono::steady_clock::now();
    try {
        operation(response);
    } catch (const FolioError& e) {
        LOG_WARNING("%s rejected: [%s] %s", MessageTypeToString(type), ErrorKindToString(e.kind()), e.what());
        response.Clear();
        codec::encode_error(e, response.mutable_error());
    } catch (const std::exception& e) {
        LOG_ERROR("%s failed: %s", MessageTypeToString(type), e.what());
        response.Clear();
        codec::encode_error(FolioError(ErrorKind::INTERNAL, "Internal server error", e.what()),
                            response.mutable_error());
    }
    const auto exec_end = std::chrono::steady_clock::now();

    reply.status = status::kOk;
    reply.content_type = ContentType::ENVELOPE;
    reply.payload = response.SerializeAsString();

    LOG_DEBUG("%s handled in %ld us (%zu response bytes)", MessageTypeToString(type),
              static_cast<long>(std::chrono::duration_cast<std::chrono::microseconds>(exec_end - exec_start).count()),
              reply.payload.size());
}

void BookStoreRpc::handleAddBooks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::AddBooks::Request request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::ADD_BOOKS, reply, [&](Folio::Protocol::Response&) {
        if (!request.has_batch()) {
            store_->add_books(nullptr);
            return;
        }
        auto books = codec::from_proto(request.batch());
        store_->add_books(&books);
    });
}

void BookStoreRpc::handleAddCopies(const std::string& message, RpcReply& reply) {
    Folio::Protocol::AddCopies::Request request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::ADD_COPIES, reply, [&](Folio::Protocol::Response&) {
        if (!request.has_batch()) {
            store_->add_copies(nullptr);
            return;
        }
        auto copies = codec::from_proto(request.batch());
        store_->add_copies(&copies);
    });
}

void BookStoreRpc::handleBuyBooks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::BuyBooks::Request request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::BUY_BOOKS, reply, [&](Folio::Protocol::Response&) {
        if (!request.has_batch()) {
            store_->buy_books(nullptr);
            return;
        }
        auto copies = codec::from_proto(request.batch());
        store_->buy_books(&copies);
    });
}

void BookStoreRpc::handleRateBooks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::RateBooks::Request request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::RATE_BOOKS, reply, [&](Folio::Protocol::Response&) {
        if (!request.has_batch()) {
            store_->rate_books(nullptr);
            return;
        }
        auto ratings = codec::from_proto(request.batch());
        store_->rate_books(&ratings);
    });
}

void BookStoreRpc::handleRemoveBooks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::RemoveBooks::Request request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::REMOVE_BOOKS, reply, [&](Folio::Protocol::Response&) {
        if (!request.has_batch()) {
            store_->remove_books(nullptr);
            return;
        }
        auto isbns = codec::from_proto(request.batch());
        store_->remove_books(&isbns);
    });
}

void BookStoreRpc::handleRemoveAllBooks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::RemoveAllBooks::Request request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::REMOVE_ALL_BOOKS, reply, [&](Folio::Protocol::Response&) {
        store_->remove_all_books();
    });
}

void BookStoreRpc::handleUpdateEditorPicks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::UpdateEditorPicks::Request request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::UPDATE_EDITOR_PICKS, reply, [&](Folio::Protocol::Response&) {
        if (!request.has_batch()) {
            store_->update_editor_picks(nullptr);
            return;
        }
        auto picks = codec::from_proto(request.batch());
        store_->update_editor_picks(&picks);
    });
}

void BookStoreRpc::handleListBooks(RpcReply& reply) {
    respond(MessageType::LIST_BOOKS, reply, [&](Folio::Protocol::Response& response) {
        codec::set_stock_books(store_->get_books(), &response);
    });
}

void BookStoreRpc::handleGetStockBooksByIsbn(const std::string& message, RpcReply& reply) {
    Folio::Protocol::IsbnQuery request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::GET_STOCK_BOOKS_BY_ISBN, reply, [&](Folio::Protocol::Response& response) {
        if (!request.has_batch()) {
            store_->get_books_by_isbn(nullptr);
            return;
        }
        auto isbns = codec::from_proto(request.batch());
        codec::set_stock_books(store_->get_books_by_isbn(&isbns), &response);
    });
}

void BookStoreRpc::handleGetBooks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::IsbnQuery request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::GET_BOOKS, reply, [&](Folio::Protocol::Response& response) {
        if (!request.has_batch()) {
            store_->get_books(nullptr);
            return;
        }
        auto isbns = codec::from_proto(request.batch());
        codec::set_books(store_->get_books(&isbns), &response);
    });
}

void BookStoreRpc::handleGetEditorPicks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::CountQuery request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::GET_EDITOR_PICKS, reply, [&](Folio::Protocol::Response& response) {
        codec::set_books(store_->get_editor_picks(request.count()), &response);
    });
}

void BookStoreRpc::handleGetTopRatedBooks(const std::string& message, RpcReply& reply) {
    Folio::Protocol::CountQuery request;
    if (!parse_request(message, request, reply)) return;

    respond(MessageType::GET_TOP_RATED_BOOKS, reply, [&](Folio::Protocol::Response& response) {
        codec::set_books(store_->get_top_rated_books(request.count()), &response);
    });
}

void BookStoreRpc::handleGetBooksInDemand(RpcReply& reply) {
    respond(MessageType::GET_BOOKS_IN_DEMAND, reply, [&](Folio::Protocol::Response& response) {
        codec::set_stock_books(store_->get_books_in_demand(), &response);
    });
}
