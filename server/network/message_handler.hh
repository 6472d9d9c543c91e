#pragma once

#include <string>

#include "../../common/message.hh"

class MessageHandler {
public:
    // Reads one frame. The header is returned in host byte order. A header
    // announcing more than kMaxPayloadSize bytes is still returned, with the
    // body left unread, and the call fails.
    static bool receive_message(int socket, MessageHeader& header, std::string& payload);

    // Sends one frame; `header` is in host byte order and its payload_size is
    // taken from `payload`.
    static bool send_response(int socket, MessageHeader header, const std::string& payload);
};
