#pragma once

#include <cstdint>

// Message header for RPC communication. Every field travels in network byte order.
struct MessageHeader {
    uint64_t sender_id;       // client ID, echoed back in the response
    uint32_t message_type;    // MessageType
    uint32_t payload_size;    // size of the protobuf payload
    uint32_t status;          // HTTP-style status on responses, 0 on requests
    uint16_t content_type;    // ContentType of the payload
    uint16_t schema_version;  // wire schema fingerprint of the sender
};

static_assert(sizeof(MessageHeader) == 24, "MessageHeader must have no padding");

// Wire tags. Values are part of the protocol and must never be reused.
enum class MessageType : uint32_t {
    UNKNOWN = 0,
    ADD_BOOKS = 1,
    ADD_COPIES = 2,
    BUY_BOOKS = 3,
    RATE_BOOKS = 4,
    REMOVE_BOOKS = 5,
    REMOVE_ALL_BOOKS = 6,
    UPDATE_EDITOR_PICKS = 7,
    LIST_BOOKS = 8,
    GET_STOCK_BOOKS_BY_ISBN = 9,
    GET_BOOKS = 10,
    GET_EDITOR_PICKS = 11,
    GET_TOP_RATED_BOOKS = 12,
    GET_BOOKS_IN_DEMAND = 13,
};

enum class RequestMethod : uint8_t {
    READ,
    WRITE,
};

enum class ContentType : uint16_t {
    NONE = 0,
    ENVELOPE = 1,
    TEXT = 2,
};

namespace status {
constexpr uint32_t kOk = 200;
constexpr uint32_t kBadRequest = 400;
constexpr uint32_t kInternalError = 500;
}  // namespace status

constexpr uint32_t kMaxPayloadSize = 16u * 1024u * 1024u;

const char* MessageTypeToString(MessageType type);

// False for UNKNOWN and for any value outside the tag table.
bool IsKnownMessageType(uint32_t raw_type);

RequestMethod MethodOf(MessageType type);

// Read-only queries without arguments travel without a body.
bool IsBodyless(MessageType type);

// Byte-order conversion of a whole header (host <-> network).
MessageHeader ToNetworkOrder(const MessageHeader& host);
MessageHeader ToHostOrder(const MessageHeader& net);
