#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorKind : uint32_t {
    INVALID_ISBN,
    DUPLICATE_ISBN,
    INVALID_RATING,
    INVALID_QUANTITY,
    INSUFFICIENT_STOCK,
    NULL_OR_EMPTY_INPUT,
    INVALID_ARGUMENT,
    INTERNAL,
    NETWORK,
    PROTOCOL,
};

const char* ErrorKindToString(ErrorKind kind);

// Base of every error raised by the catalog, the server and the client.
class FolioError : public std::runtime_error {
public:
    FolioError(ErrorKind kind, const std::string& message, std::string cause = "")
        : std::runtime_error(message), kind_(kind), cause_(std::move(cause)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& cause() const { return cause_; }
    bool has_cause() const { return !cause_.empty(); }

    static FolioError invalid_isbn(int32_t isbn);
    static FolioError duplicate_isbn(int32_t isbn);
    static FolioError invalid_rating(int32_t isbn, int32_t rating);
    static FolioError invalid_quantity(int32_t isbn, int64_t quantity);
    static FolioError insufficient_stock(const std::string& detail);
    static FolioError null_or_empty(const char* what);
    static FolioError invalid_argument(const std::string& message);

private:
    ErrorKind kind_;
    std::string cause_;
};

// The call never reached the server or never came back from it.
class NetworkError : public FolioError {
public:
    explicit NetworkError(const std::string& message, std::string cause = "")
        : FolioError(ErrorKind::NETWORK, message, std::move(cause)) {}
};

// The server answered, but not with a well-formed envelope.
class ProtocolError : public FolioError {
public:
    static constexpr size_t kMaxBodyExcerpt = 256;

    ProtocolError(const std::string& message, uint32_t status = 0, const std::string& body = "")
        : FolioError(ErrorKind::PROTOCOL, compose(message, status, body)),
          status_(status),
          body_excerpt_(body.substr(0, kMaxBodyExcerpt)) {}

    uint32_t status() const { return status_; }
    const std::string& body_excerpt() const { return body_excerpt_; }

private:
    static std::string compose(const std::string& message, uint32_t status, const std::string& body);

    uint32_t status_;
    std::string body_excerpt_;
};

// An application error raised by the server, re-raised locally with its kind intact.
class RemoteApplicationError : public FolioError {
public:
    RemoteApplicationError(ErrorKind kind, const std::string& message, std::string cause = "")
        : FolioError(kind, message, std::move(cause)) {}
};
