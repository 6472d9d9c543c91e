#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "book.hh"
#include "errors.hh"
#include "folio.pb.h"

namespace codec {

// Ordered list of every message the protocol can carry. Both ends must be
// built from the same list; its fingerprint is sent in every frame header.
extern const char* const kWireTypes[];
extern const size_t kWireTypeCount;

uint16_t schema_fingerprint();

// Throws ProtocolError if a listed type is missing from the generated pool.
void verify_wire_schema();

void to_proto(const Book& book, Folio::Protocol::Book* out);
void to_proto(const StockBook& book, Folio::Protocol::StockBook* out);
Book from_proto(const Folio::Protocol::Book& book);
StockBook from_proto(const Folio::Protocol::StockBook& book);

void to_proto(const std::vector<StockBook>& books, Folio::Protocol::StockBookBatch* out);
void to_proto(const std::vector<BookCopy>& copies, Folio::Protocol::BookCopyBatch* out);
void to_proto(const std::vector<BookRating>& ratings, Folio::Protocol::BookRatingBatch* out);
void to_proto(const std::vector<BookEditorPick>& picks, Folio::Protocol::BookEditorPickBatch* out);
void to_proto(const std::vector<int32_t>& isbns, Folio::Protocol::IsbnBatch* out);

std::vector<StockBook> from_proto(const Folio::Protocol::StockBookBatch& batch);
std::vector<BookCopy> from_proto(const Folio::Protocol::BookCopyBatch& batch);
std::vector<BookRating> from_proto(const Folio::Protocol::BookRatingBatch& batch);
std::vector<BookEditorPick> from_proto(const Folio::Protocol::BookEditorPickBatch& batch);
std::vector<int32_t> from_proto(const Folio::Protocol::IsbnBatch& batch);

void set_books(const std::vector<Book>& books, Folio::Protocol::Response* response);
void set_stock_books(const std::vector<StockBook>& books, Folio::Protocol::Response* response);
std::vector<Book> books_of(const Folio::Protocol::Response& response);
std::vector<StockBook> stock_books_of(const Folio::Protocol::Response& response);

Folio::Protocol::ErrorKind to_proto(ErrorKind kind);
ErrorKind from_proto(Folio::Protocol::ErrorKind kind);

void encode_error(const FolioError& error, Folio::Protocol::Error* out);

// Throws RemoteApplicationError rebuilt from an embedded error.
[[noreturn]] void raise_remote_error(const Folio::Protocol::Error& error);

}  // namespace codec
