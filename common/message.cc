#include "message.hh"

#include <arpa/inet.h>
#include <endian.h>

const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::ADD_BOOKS: return "ADD_BOOKS";
        case MessageType::ADD_COPIES: return "ADD_COPIES";
        case MessageType::BUY_BOOKS: return "BUY_BOOKS";
        case MessageType::RATE_BOOKS: return "RATE_BOOKS";
        case MessageType::REMOVE_BOOKS: return "REMOVE_BOOKS";
        case MessageType::REMOVE_ALL_BOOKS: return "REMOVE_ALL_BOOKS";
        case MessageType::UPDATE_EDITOR_PICKS: return "UPDATE_EDITOR_PICKS";
        case MessageType::LIST_BOOKS: return "LIST_BOOKS";
        case MessageType::GET_STOCK_BOOKS_BY_ISBN: return "GET_STOCK_BOOKS_BY_ISBN";
        case MessageType::GET_BOOKS: return "GET_BOOKS";
        case MessageType::GET_EDITOR_PICKS: return "GET_EDITOR_PICKS";
        case MessageType::GET_TOP_RATED_BOOKS: return "GET_TOP_RATED_BOOKS";
        case MessageType::GET_BOOKS_IN_DEMAND: return "GET_BOOKS_IN_DEMAND";
        default: return "UNKNOWN";
    }
}

bool IsKnownMessageType(uint32_t raw_type) {
    return raw_type >= static_cast<uint32_t>(MessageType::ADD_BOOKS) &&
           raw_type <= static_cast<uint32_t>(MessageType::GET_BOOKS_IN_DEMAND);
}

RequestMethod MethodOf(MessageType type) {
    switch (type) {
        case MessageType::LIST_BOOKS:
        case MessageType::GET_STOCK_BOOKS_BY_ISBN:
        case MessageType::GET_BOOKS:
        case MessageType::GET_EDITOR_PICKS:
        case MessageType::GET_TOP_RATED_BOOKS:
        case MessageType::GET_BOOKS_IN_DEMAND:
            return RequestMethod::READ;
        default:
            return RequestMethod::WRITE;
    }
}

bool IsBodyless(MessageType type) {
    return type == MessageType::LIST_BOOKS || type == MessageType::GET_BOOKS_IN_DEMAND;
}

MessageHeader ToNetworkOrder(const MessageHeader& host) {
    MessageHeader net;
    net.sender_id = htobe64(host.sender_id);
    net.message_type = htonl(host.message_type);
    net.payload_size = htonl(host.payload_size);
    net.status = htonl(host.status);
    net.content_type = htons(host.content_type);
    net.schema_version = htons(host.schema_version);
    return net;
}

MessageHeader ToHostOrder(const MessageHeader& net) {
    MessageHeader host;
    host.sender_id = be64toh(net.sender_id);
    host.message_type = ntohl(net.message_type);
    host.payload_size = ntohl(net.payload_size);
    host.status = ntohl(net.status);
    host.content_type = ntohs(net.content_type);
    host.schema_version = ntohs(net.schema_version);
    return host;
}
