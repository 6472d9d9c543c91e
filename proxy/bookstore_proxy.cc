#include "bookstore_proxy.hh"
#include "../common/codec.hh"

BookStoreProxy::BookStoreProxy(const ClientConfig& conf) : channel_(conf) {}

void BookStoreProxy::buy_books(const std::vector<BookCopy>* copies) {
    Folio::Protocol::BuyBooks::Request request;
    if (copies) {
        codec::to_proto(*copies, request.mutable_batch());
    }
    channel_.call(MessageType::BUY_BOOKS, &request);
}

std::vector<Book> BookStoreProxy::get_books(const std::vector<int32_t>* isbns) {
    Folio::Protocol::IsbnQuery request;
    if (isbns) {
        codec::to_proto(*isbns, request.mutable_batch());
    }
    return codec::books_of(channel_.call(MessageType::GET_BOOKS, &request));
}

std::vector<Book> BookStoreProxy::get_editor_picks(int32_t num_books) {
    Folio::Protocol::CountQuery request;
    request.set_count(num_books);
    return codec::books_of(channel_.call(MessageType::GET_EDITOR_PICKS, &request));
}

void BookStoreProxy::rate_books(const std::vector<BookRating>* ratings) {
    Folio::Protocol::RateBooks::Request request;
    if (ratings) {
        codec::to_proto(*ratings, request.mutable_batch());
    }
    channel_.call(MessageType::RATE_BOOKS, &request);
}

std::vector<Book> BookStoreProxy::get_top_rated_books(int32_t num_books) {
    Folio::Protocol::CountQuery request;
    request.set_count(num_books);
    return codec::books_of(channel_.call(MessageType::GET_TOP_RATED_BOOKS, &request));
}
