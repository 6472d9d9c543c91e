#include "message_handler.hh"
#include "../../common/log.h"

#include <cerrno>
#include <cstring>
#include <vector>
#include <sys/socket.h>
#include <netinet/in.h>

bool MessageHandler::receive_message(int socket, MessageHeader& header, std::string& payload) {
    // Read fixed-size header
    MessageHeader net_header{};
    ssize_t header_read = recv(socket, &net_header, sizeof(net_header), MSG_WAITALL);
    if (header_read != static_cast<ssize_t>(sizeof(net_header))) {
        if (header_read < 0) {
            int err = errno;
            LOG_ERROR("Failed to receive message header: %s", std::strerror(err));
        } else {
            LOG_DEBUG("Client disconnected while receiving header");
        }
        return false;
    }

    header = ToHostOrder(net_header);

    LOG_DEBUG("Received header: sender_id=%lu, message_type=%u, payload_size=%u, schema=%u",
              header.sender_id, header.message_type, header.payload_size,
              static_cast<unsigned>(header.schema_version));

    if (header.payload_size > kMaxPayloadSize) {
        LOG_ERROR("Payload of %u bytes exceeds the %u byte limit", header.payload_size, kMaxPayloadSize);
        return false;
    }

    // Read payload (if exists)
    payload.clear();
    if (header.payload_size > 0) {
        payload.resize(header.payload_size);
        ssize_t body_read = recv(socket, &payload[0], header.payload_size, MSG_WAITALL);
        if (body_read != static_cast<ssize_t>(header.payload_size)) {
            if (body_read < 0) {
                int err = errno;
                LOG_ERROR("Failed to receive message payload: %s", std::strerror(err));
            } else {
                LOG_DEBUG("Client disconnected while receiving payload");
            }
            return false;
        }
    }

    return true;
}

bool MessageHandler::send_response(int socket, MessageHeader header, const std::string& payload) {
    LOG_DEBUG("Sending response (%zu bytes, status=%u)", payload.size(), header.status);

    header.payload_size = static_cast<uint32_t>(payload.size());
    MessageHeader net_header = ToNetworkOrder(header);

    // Combine header and response
    size_t response_total_size = sizeof(net_header) + payload.size();
    std::vector<char> response_buffer(response_total_size);
    std::memcpy(response_buffer.data(), &net_header, sizeof(net_header));
    std::memcpy(response_buffer.data() + sizeof(net_header), payload.data(), payload.size());

    // Send response
    size_t sent = 0;
    while (sent < response_total_size) {
        ssize_t bytes_sent = send(socket, response_buffer.data() + sent, response_total_size - sent, MSG_NOSIGNAL);
        if (bytes_sent < 0 && errno == EINTR) continue;
        if (bytes_sent <= 0) {
            int err = errno;
            LOG_ERROR("Failed to send response: %s", std::strerror(err));
            return false;
        }
        sent += static_cast<size_t>(bytes_sent);
    }

    LOG_DEBUG("Response sent successfully");
    return true;
}
