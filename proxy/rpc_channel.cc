#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>
#include <atomic>
#include <cstring>
#include <vector>

#include "rpc_channel.hh"
#include "../common/codec.hh"
#include "../common/errors.hh"
#include "../common/log.h"

namespace {

std::atomic<uint64_t> g_next_sender_id{1};

// Marks the call finished however the enclosing scope is left.
struct DoneOnExit {
    CallState& state;
    ~DoneOnExit() { state = CallState::DONE; }
};

}  // namespace

const char* CallStateToString(CallState state) {
    switch (state) {
        case CallState::IDLE: return "IDLE";
        case CallState::ENCODING: return "ENCODING";
        case CallState::IN_FLIGHT: return "IN_FLIGHT";
        case CallState::DECODING: return "DECODING";
        case CallState::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

RpcChannel::RpcChannel(const ClientConfig& conf)
    : conf_(conf),
      socket_fd_(-1),
      sender_id_((static_cast<uint64_t>(getpid()) << 32) | g_next_sender_id.fetch_add(1)),
      state_(CallState::IDLE) {
    codec::verify_wire_schema();
    LOG_DEBUG("RpcChannel(%p): target %s:%u", static_cast<const void*>(this), conf_.host.c_str(),
              static_cast<unsigned>(conf_.port));
}

RpcChannel::~RpcChannel() {
    disconnect();
}

void RpcChannel::connect() {
    if (socket_fd_ >= 0) {
        disconnect();
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addresses = nullptr;
    const std::string port = std::to_string(conf_.port);
    int rc = getaddrinfo(conf_.host.c_str(), port.c_str(), &hints, &addresses);
    if (rc != 0) {
        throw NetworkError("Cannot resolve " + conf_.host, gai_strerror(rc));
    }

    int last_errno = 0;
    for (struct addrinfo* addr = addresses; addr != nullptr; addr = addr->ai_next) {
        int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }

        struct timeval timeout;
        timeout.tv_sec = conf_.timeout_ms / 1000;
        timeout.tv_usec = (conf_.timeout_ms % 1000) * 1000;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        if (::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0) {
            socket_fd_ = fd;
            break;
        }
        last_errno = errno;
        close(fd);
    }
    freeaddrinfo(addresses);

    if (socket_fd_ < 0) {
        throw NetworkError("Failed to connect to Folio server at " + conf_.host + ":" + port,
                           std::strerror(last_errno));
    }
    LOG_DEBUG("RpcChannel(%p): connected fd=%d", static_cast<const void*>(this), socket_fd_);
}

void RpcChannel::disconnect() {
    if (socket_fd_ >= 0) {
        LOG_DEBUG("RpcChannel(%p): disconnecting socket_fd=%d",
                  static_cast<const void*>(this), socket_fd_);
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool RpcChannel::is_connected() const {
    return socket_fd_ >= 0;
}

void RpcChannel::fail_network(const std::string& message, int err) {
    LOG_DEBUG("CLIENT(%lu): network failure while %s in state %s (errno=%d)", sender_id_, message.c_str(),
              CallStateToString(state_), err);
    disconnect();
    if (err == EAGAIN || err == EWOULDBLOCK) {
        throw NetworkError("Request timed out: " + message, std::strerror(err));
    }
    if (err == EINTR) {
        throw NetworkError("Request interrupted: " + message, std::strerror(err));
    }
    if (err == 0) {
        throw NetworkError("Connection closed by server: " + message);
    }
    throw NetworkError("Request failed: " + message, std::strerror(err));
}

Folio::Protocol::Response RpcChannel::call(MessageType message_type, const google::protobuf::Message* request) {
    state_ = CallState::IDLE;
    DoneOnExit done{state_};
    const char* name = MessageTypeToString(message_type);
    LOG_DEBUG("CLIENT: %s called", name);

    // encode request
    state_ = CallState::ENCODING;
    std::string body;
    if (!IsBodyless(message_type)) {
        if (request == nullptr) {
            throw ProtocolError(std::string("Request body required for ") + name);
        }
        if (!request->SerializeToString(&body)) {
            throw ProtocolError(std::string("Serialization error for ") + name);
        }
        if (body.size() > kMaxPayloadSize) {
            throw ProtocolError(std::string("Request body for ") + name + " is " + std::to_string(body.size()) +
                                " bytes, over the " + std::to_string(kMaxPayloadSize) + " byte limit");
        }
    }

    // exchange frames
    state_ = CallState::IN_FLIGHT;
    if (socket_fd_ < 0) {
        connect();
    }
    send_frame(message_type, body);
    MessageHeader response_header{};
    std::string response_body;
    receive_frame(response_header, response_body);

    // validate response before deserialising
    state_ = CallState::DECODING;
    if (response_header.status != status::kOk) {
        throw ProtocolError(std::string("Remote server rejected ") + name, response_header.status, response_body);
    }
    if (response_header.content_type != static_cast<uint16_t>(ContentType::ENVELOPE)) {
        throw ProtocolError("Expected a response envelope but received content type " +
                                std::to_string(response_header.content_type),
                            response_header.status, response_body);
    }
    if (response_header.message_type != static_cast<uint32_t>(message_type)) {
        throw ProtocolError(std::string("Response tag does not match request ") + name + ": got " +
                                std::to_string(response_header.message_type),
                            response_header.status);
    }

    Folio::Protocol::Response response;
    if (!response.ParseFromString(response_body)) {
        throw ProtocolError(std::string("Deserialization error for ") + name, response_header.status);
    }

    // propagate any server-side error back to the caller
    if (response.has_error()) {
        LOG_DEBUG("CLIENT: %s returned remote error: %s", name, response.error().message().c_str());
        codec::raise_remote_error(response.error());
    }

    LOG_DEBUG("CLIENT: %s completed", name);
    return response;
}

void RpcChannel::send_frame(MessageType message_type, const std::string& body) {
    // prepare message header
    MessageHeader header{};
    header.sender_id = sender_id_;
    header.message_type = static_cast<uint32_t>(message_type);
    header.payload_size = static_cast<uint32_t>(body.size());
    header.status = 0;
    header.content_type = static_cast<uint16_t>(body.empty() ? ContentType::NONE : ContentType::ENVELOPE);
    header.schema_version = codec::schema_fingerprint();
    MessageHeader net_header = ToNetworkOrder(header);

    // combine header and payload
    size_t total_size = sizeof(net_header) + body.size();
    std::vector<char> buffer(total_size);
    std::memcpy(buffer.data(), &net_header, sizeof(net_header));
    std::memcpy(buffer.data() + sizeof(net_header), body.data(), body.size());

    // send
    size_t sent = 0;
    while (sent < total_size) {
        ssize_t bytes_sent = send(socket_fd_, buffer.data() + sent, total_size - sent, MSG_NOSIGNAL);
        if (bytes_sent < 0) {
            fail_network("sending " + std::string(MessageTypeToString(message_type)), errno);
        }
        sent += static_cast<size_t>(bytes_sent);
    }
    LOG_DEBUG("SEND_MESSAGE: sent %zu bytes", total_size);
}

void RpcChannel::receive_exact(char* buffer, size_t size, const char* what) {
    size_t received = 0;
    while (received < size) {
        ssize_t n = recv(socket_fd_, buffer + received, size - received, 0);
        if (n < 0) {
            fail_network(std::string("receiving ") + what, errno);
        }
        if (n == 0) {
            fail_network(std::string("receiving ") + what, 0);
        }
        received += static_cast<size_t>(n);
    }
}

void RpcChannel::receive_frame(MessageHeader& header, std::string& body) {
    // receive response header
    MessageHeader net_header{};
    receive_exact(reinterpret_cast<char*>(&net_header), sizeof(net_header), "response header");
    header = ToHostOrder(net_header);

    LOG_DEBUG("SEND_MESSAGE: Received response header: sender_id=%lu, message_type=%u, payload_size=%u, status=%u",
              header.sender_id, header.message_type, header.payload_size, header.status);

    if (header.payload_size > kMaxPayloadSize) {
        disconnect();
        throw ProtocolError("Response payload of " + std::to_string(header.payload_size) + " bytes exceeds the limit",
                            header.status);
    }

    // receive response payload
    body.clear();
    if (header.payload_size > 0) {
        body.resize(header.payload_size);
        receive_exact(&body[0], header.payload_size, "response payload");
    }
}
