#include "codec.hh"

#include <google/protobuf/descriptor.h>

#include <string>

namespace codec {

// Order is part of the contract.
const char* const kWireTypes[] = {
    "Folio.Protocol.Book",
    "Folio.Protocol.StockBook",
    "Folio.Protocol.BookCopy",
    "Folio.Protocol.BookRating",
    "Folio.Protocol.BookEditorPick",
    "Folio.Protocol.StockBookBatch",
    "Folio.Protocol.BookCopyBatch",
    "Folio.Protocol.BookRatingBatch",
    "Folio.Protocol.BookEditorPickBatch",
    "Folio.Protocol.IsbnBatch",
    "Folio.Protocol.Error",
    "Folio.Protocol.AddBooks.Request",
    "Folio.Protocol.AddCopies.Request",
    "Folio.Protocol.BuyBooks.Request",
    "Folio.Protocol.RateBooks.Request",
    "Folio.Protocol.RemoveBooks.Request",
    "Folio.Protocol.RemoveAllBooks.Request",
    "Folio.Protocol.UpdateEditorPicks.Request",
    "Folio.Protocol.IsbnQuery",
    "Folio.Protocol.CountQuery",
    "Folio.Protocol.Response",
};

const size_t kWireTypeCount = sizeof(kWireTypes) / sizeof(kWireTypes[0]);

uint16_t schema_fingerprint() {
    static const uint16_t fingerprint = []() {
        // FNV-1a over the ordered names, folded to 16 bits.
        uint32_t hash = 2166136261u;
        for (size_t i = 0; i < kWireTypeCount; ++i) {
            for (const char* c = kWireTypes[i]; *c != '\0'; ++c) {
                hash ^= static_cast<uint8_t>(*c);
                hash *= 16777619u;
            }
            hash ^= static_cast<uint8_t>('\n');
            hash *= 16777619u;
        }
        return static_cast<uint16_t>((hash >> 16) ^ (hash & 0xFFFFu));
    }();
    return fingerprint;
}

void verify_wire_schema() {
    const auto* pool = google::protobuf::DescriptorPool::generated_pool();
    for (size_t i = 0; i < kWireTypeCount; ++i) {
        if (pool->FindMessageTypeByName(kWireTypes[i]) == nullptr) {
            throw ProtocolError(std::string("Wire type not registered: ") + kWireTypes[i]);
        }
    }
}

void to_proto(const Book& book, Folio::Protocol::Book* out) {
    out->set_isbn(book.isbn);
    out->set_title(book.title);
    out->set_author(book.author);
    out->set_price(book.price);
}

void to_proto(const StockBook& book, Folio::Protocol::StockBook* out) {
    auto* view = out->mutable_book();
    view->set_isbn(book.isbn);
    view->set_title(book.title);
    view->set_author(book.author);
    view->set_price(book.price);
    out->set_num_copies(book.num_copies);
    out->set_num_sale_misses(book.num_sale_misses);
    out->set_total_rating(book.total_rating);
    out->set_num_times_rated(book.num_times_rated);
    out->set_editor_pick(book.editor_pick);
}

Book from_proto(const Folio::Protocol::Book& book) {
    Book result;
    result.isbn = book.isbn();
    result.title = book.title();
    result.author = book.author();
    result.price = book.price();
    return result;
}

StockBook from_proto(const Folio::Protocol::StockBook& book) {
    StockBook result;
    result.isbn = book.book().isbn();
    result.title = book.book().title();
    result.author = book.book().author();
    result.price = book.book().price();
    result.num_copies = book.num_copies();
    result.num_sale_misses = book.num_sale_misses();
    result.total_rating = book.total_rating();
    result.num_times_rated = book.num_times_rated();
    result.editor_pick = book.editor_pick();
    return result;
}

void to_proto(const std::vector<StockBook>& books, Folio::Protocol::StockBookBatch* out) {
    for (const auto& book : books) {
        to_proto(book, out->add_books());
    }
}

void to_proto(const std::vector<BookCopy>& copies, Folio::Protocol::BookCopyBatch* out) {
    for (const auto& copy : copies) {
        auto* entry = out->add_copies();
        entry->set_isbn(copy.isbn);
        entry->set_num_copies(copy.num_copies);
    }
}

void to_proto(const std::vector<BookRating>& ratings, Folio::Protocol::BookRatingBatch* out) {
    for (const auto& rating : ratings) {
        auto* entry = out->add_ratings();
        entry->set_isbn(rating.isbn);
        entry->set_rating(rating.rating);
    }
}

void to_proto(const std::vector<BookEditorPick>& picks, Folio::Protocol::BookEditorPickBatch* out) {
    for (const auto& pick : picks) {
        auto* entry = out->add_picks();
        entry->set_isbn(pick.isbn);
        entry->set_editor_pick(pick.editor_pick);
    }
}

void to_proto(const std::vector<int32_t>& isbns, Folio::Protocol::IsbnBatch* out) {
    for (int32_t isbn : isbns) {
        out->add_isbns(isbn);
    }
}

std::vector<StockBook> from_proto(const Folio::Protocol::StockBookBatch& batch) {
    std::vector<StockBook> books;
    books.reserve(batch.books_size());
    for (const auto& book : batch.books()) {
        books.push_back(from_proto(book));
    }
    return books;
}

std::vector<BookCopy> from_proto(const Folio::Protocol::BookCopyBatch& batch) {
    std::vector<BookCopy> copies;
    copies.reserve(batch.copies_size());
    for (const auto& entry : batch.copies()) {
        copies.push_back(BookCopy{entry.isbn(), entry.num_copies()});
    }
    return copies;
}

std::vector<BookRating> from_proto(const Folio::Protocol::BookRatingBatch& batch) {
    std::vector<BookRating> ratings;
    ratings.reserve(batch.ratings_size());
    for (const auto& entry : batch.ratings()) {
        ratings.push_back(BookRating{entry.isbn(), entry.rating()});
    }
    return ratings;
}

std::vector<BookEditorPick> from_proto(const Folio::Protocol::BookEditorPickBatch& batch) {
    std::vector<BookEditorPick> picks;
    picks.reserve(batch.picks_size());
    for (const auto& entry : batch.picks()) {
        picks.push_back(BookEditorPick{entry.isbn(), entry.editor_pick()});
    }
    return picks;
}

std::vector<int32_t> from_proto(const Folio::Protocol::IsbnBatch& batch) {
    return std::vector<int32_t>(batch.isbns().begin(), batch.isbns().end());
}

void set_books(const std::vector<Book>& books, Folio::Protocol::Response* response) {
    for (const auto& book : books) {
        to_proto(book, response->add_books());
    }
}

void set_stock_books(const std::vector<StockBook>& books, Folio::Protocol::Response* response) {
    for (const auto& book : books) {
        to_proto(book, response->add_stock_books());
    }
}

std::vector<Book> books_of(const Folio::Protocol::Response& response) {
    std::vector<Book> books;
    books.reserve(response.books_size());
    for (const auto& book : response.books()) {
        books.push_back(from_proto(book));
    }
    return books;
}

std::vector<StockBook> stock_books_of(const Folio::Protocol::Response& response) {
    std::vector<StockBook> books;
    books.reserve(response.stock_books_size());
    for (const auto& book : response.stock_books()) {
        books.push_back(from_proto(book));
    }
    return books;
}

Folio::Protocol::ErrorKind to_proto(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ISBN:        return Folio::Protocol::INVALID_ISBN;
        case ErrorKind::DUPLICATE_ISBN:      return Folio::Protocol::DUPLICATE_ISBN;
        case ErrorKind::INVALID_RATING:      return Folio::Protocol::INVALID_RATING;
        case ErrorKind::INVALID_QUANTITY:    return Folio::Protocol::INVALID_QUANTITY;
        case ErrorKind::INSUFFICIENT_STOCK:  return Folio::Protocol::INSUFFICIENT_STOCK;
        case ErrorKind::NULL_OR_EMPTY_INPUT: return Folio::Protocol::NULL_OR_EMPTY_INPUT;
        case ErrorKind::INVALID_ARGUMENT:    return Folio::Protocol::INVALID_ARGUMENT;
        default:                             return Folio::Protocol::INTERNAL;
    }
}

ErrorKind from_proto(Folio::Protocol::ErrorKind kind) {
    switch (kind) {
        case Folio::Protocol::INVALID_ISBN:        return ErrorKind::INVALID_ISBN;
        case Folio::Protocol::DUPLICATE_ISBN:      return ErrorKind::DUPLICATE_ISBN;
        case Folio::Protocol::INVALID_RATING:      return ErrorKind::INVALID_RATING;
        case Folio::Protocol::INVALID_QUANTITY:    return ErrorKind::INVALID_QUANTITY;
        case Folio::Protocol::INSUFFICIENT_STOCK:  return ErrorKind::INSUFFICIENT_STOCK;
        case Folio::Protocol::NULL_OR_EMPTY_INPUT: return ErrorKind::NULL_OR_EMPTY_INPUT;
        case Folio::Protocol::INVALID_ARGUMENT:    return ErrorKind::INVALID_ARGUMENT;
        default:                                   return ErrorKind::INTERNAL;
    }
}

void encode_error(const FolioError& error, Folio::Protocol::Error* out) {
    out->set_kind(to_proto(error.kind()));
    out->set_message(error.what());
    if (error.has_cause()) {
        out->set_cause(error.cause());
    }
}

void raise_remote_error(const Folio::Protocol::Error& error) {
    throw RemoteApplicationError(from_proto(error.kind()), error.message(), error.cause());
}

}  // namespace codec
