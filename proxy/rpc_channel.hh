#ifndef FOLIO_RPC_CHANNEL_H
#define FOLIO_RPC_CHANNEL_H

#include <cstdint>
#include <string>

#include <google/protobuf/message.h>

#include "../common/config.hh"
#include "../common/message.hh"
#include "folio.pb.h"

// Progress of the current (or last) call. DONE is terminal for both
// success and failure; a new call starts again from IDLE.
enum class CallState {
    IDLE,
    ENCODING,
    IN_FLIGHT,
    DECODING,
    DONE,
};

const char* CallStateToString(CallState state);

/**
 * @brief
 * Blocking request/response channel to a Folio server over one TCP
 * connection. Connects lazily on the first call and drops the connection
 * after a network failure, so the next call reconnects. There are no
 * retries: every failure is raised to the caller.
 *
 * Not thread-safe; use one channel per thread.
 */
class RpcChannel {
public:
    explicit RpcChannel(const ClientConfig& conf);
    ~RpcChannel();

    RpcChannel(const RpcChannel&) = delete;
    RpcChannel& operator=(const RpcChannel&) = delete;

    // connection management
    void connect();
    void disconnect();
    bool is_connected() const;

    // Sends `request` (ignored for bodyless tags) and returns the decoded
    // envelope. Throws NetworkError, ProtocolError, or
    // RemoteApplicationError for an error embedded by the server.
    Folio::Protocol::Response call(MessageType message_type, const google::protobuf::Message* request);

    CallState state() const { return state_; }

private:
    void send_frame(MessageType message_type, const std::string& body);
    void receive_frame(MessageHeader& header, std::string& body);
    void receive_exact(char* buffer, size_t size, const char* what);
    [[noreturn]] void fail_network(const std::string& message, int err);

    ClientConfig conf_;
    int socket_fd_;
    uint64_t sender_id_;
    CallState state_;
};

#endif // FOLIO_RPC_CHANNEL_H
