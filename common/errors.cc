#include "errors.hh"

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ISBN:        return "InvalidISBN";
        case ErrorKind::DUPLICATE_ISBN:      return "DuplicateISBN";
        case ErrorKind::INVALID_RATING:      return "InvalidRating";
        case ErrorKind::INVALID_QUANTITY:    return "InvalidQuantity";
        case ErrorKind::INSUFFICIENT_STOCK:  return "InsufficientStock";
        case ErrorKind::NULL_OR_EMPTY_INPUT: return "NullOrEmptyInput";
        case ErrorKind::INVALID_ARGUMENT:    return "InvalidArgument";
        case ErrorKind::INTERNAL:            return "Internal";
        case ErrorKind::NETWORK:             return "NetworkError";
        case ErrorKind::PROTOCOL:            return "ProtocolError";
        default:                             return "Unknown";
    }
}

FolioError FolioError::invalid_isbn(int32_t isbn) {
    return FolioError(ErrorKind::INVALID_ISBN, "ISBN " + std::to_string(isbn) + " is invalid or not in the catalog");
}

FolioError FolioError::duplicate_isbn(int32_t isbn) {
    return FolioError(ErrorKind::DUPLICATE_ISBN, "ISBN " + std::to_string(isbn) + " is duplicated");
}

FolioError FolioError::invalid_rating(int32_t isbn, int32_t rating) {
    return FolioError(ErrorKind::INVALID_RATING,
                      "Rating " + std::to_string(rating) + " for ISBN " + std::to_string(isbn) +
                          " is outside [0,5]");
}

FolioError FolioError::invalid_quantity(int32_t isbn, int64_t quantity) {
    return FolioError(ErrorKind::INVALID_QUANTITY,
                      "Quantity " + std::to_string(quantity) + " for ISBN " + std::to_string(isbn) +
                          " must be positive");
}

FolioError FolioError::insufficient_stock(const std::string& detail) {
    return FolioError(ErrorKind::INSUFFICIENT_STOCK, "Insufficient stock: " + detail);
}

FolioError FolioError::null_or_empty(const char* what) {
    return FolioError(ErrorKind::NULL_OR_EMPTY_INPUT, std::string(what) + " is null or empty");
}

FolioError FolioError::invalid_argument(const std::string& message) {
    return FolioError(ErrorKind::INVALID_ARGUMENT, message);
}

std::string ProtocolError::compose(const std::string& message, uint32_t status, const std::string& body) {
    std::string composed = message;
    if (status != 0) {
        composed += " (status " + std::to_string(status) + ")";
    }
    if (!body.empty()) {
        composed += ":\n" + body.substr(0, kMaxBodyExcerpt);
    }
    return composed;
}
