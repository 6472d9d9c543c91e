#pragma once

#include <cstdint>
#include <vector>

#include "book.hh"

// Batch arguments are passed by pointer: nullptr is a null batch, which
// every operation rejects with NULL_OR_EMPTY_INPUT. All operations throw
// FolioError (or a subclass) on failure.

// Customer-facing operations.
class BookStore {
public:
    virtual ~BookStore() = default;

    virtual void buy_books(const std::vector<BookCopy>* copies) = 0;
    virtual std::vector<Book> get_books(const std::vector<int32_t>* isbns) = 0;
    virtual std::vector<Book> get_editor_picks(int32_t num_books) = 0;
    virtual void rate_books(const std::vector<BookRating>* ratings) = 0;
    virtual std::vector<Book> get_top_rated_books(int32_t num_books) = 0;
};

// Administrative operations.
class StockManager {
public:
    virtual ~StockManager() = default;

    virtual void add_books(const std::vector<StockBook>* books) = 0;
    virtual void add_copies(const std::vector<BookCopy>* copies) = 0;
    virtual std::vector<StockBook> get_books() = 0;
    virtual std::vector<StockBook> get_books_by_isbn(const std::vector<int32_t>* isbns) = 0;
    virtual void update_editor_picks(const std::vector<BookEditorPick>* picks) = 0;
    virtual std::vector<StockBook> get_books_in_demand() = 0;
    virtual void remove_books(const std::vector<int32_t>* isbns) = 0;
    virtual void remove_all_books() = 0;
};
