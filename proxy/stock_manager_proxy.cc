#include "stock_manager_proxy.hh"
#include "../common/codec.hh"

StockManagerProxy::StockManagerProxy(const ClientConfig& conf) : channel_(conf) {}

void StockManagerProxy::add_books(const std::vector<StockBook>* books) {
    Folio::Protocol::AddBooks::Request request;
    if (books) {
        codec::to_proto(*books, request.mutable_batch());
    }
    channel_.call(MessageType::ADD_BOOKS, &request);
}

void StockManagerProxy::add_copies(const std::vector<BookCopy>* copies) {
    Folio::Protocol::AddCopies::Request request;
    if (copies) {
        codec::to_proto(*copies, request.mutable_batch());
    }
    channel_.call(MessageType::ADD_COPIES, &request);
}

std::vector<StockBook> StockManagerProxy::get_books() {
    return codec::stock_books_of(channel_.call(MessageType::LIST_BOOKS, nullptr));
}

std::vector<StockBook> StockManagerProxy::get_books_by_isbn(const std::vector<int32_t>* isbns) {
    Folio::Protocol::IsbnQuery request;
    if (isbns) {
        codec::to_proto(*isbns, request.mutable_batch());
    }
    return codec::stock_books_of(channel_.call(MessageType::GET_STOCK_BOOKS_BY_ISBN, &request));
}

void StockManagerProxy::update_editor_picks(const std::vector<BookEditorPick>* picks) {
    Folio::Protocol::UpdateEditorPicks::Request request;
    if (picks) {
        codec::to_proto(*picks, request.mutable_batch());
    }
    channel_.call(MessageType::UPDATE_EDITOR_PICKS, &request);
}

std::vector<StockBook> StockManagerProxy::get_books_in_demand() {
    return codec::stock_books_of(channel_.call(MessageType::GET_BOOKS_IN_DEMAND, nullptr));
}

void StockManagerProxy::remove_books(const std::vector<int32_t>* isbns) {
    Folio::Protocol::RemoveBooks::Request request;
    if (isbns) {
        codec::to_proto(*isbns, request.mutable_batch());
    }
    channel_.call(MessageType::REMOVE_BOOKS, &request);
}

void StockManagerProxy::remove_all_books() {
    Folio::Protocol::RemoveAllBooks::Request request;
    channel_.call(MessageType::REMOVE_ALL_BOOKS, &request);
}
