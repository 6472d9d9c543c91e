#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Public view of a catalog entry.
struct Book {
    int32_t isbn = 0;
    std::string title;
    std::string author;
    float price = 0.0f;
};

// Administrative aggregate. The store owns the live instances; everything
// handed out of the store is a copy.
struct StockBook {
    int32_t isbn = 0;
    std::string title;
    std::string author;
    float price = 0.0f;
    int32_t num_copies = 0;
    int64_t num_sale_misses = 0;
    int64_t total_rating = 0;
    int64_t num_times_rated = 0;
    bool editor_pick = false;

    // totalRating / numTimesRated, or 0 when the book was never rated.
    double average_rating() const;
};

struct BookCopy {
    int32_t isbn = 0;
    int32_t num_copies = 0;
};

struct BookRating {
    int32_t isbn = 0;
    int32_t rating = 0;
};

struct BookEditorPick {
    int32_t isbn = 0;
    bool editor_pick = false;
};

Book to_book(const StockBook& stock_book);
std::vector<Book> to_books(const std::vector<StockBook>& stock_books);

StockBook make_stock_book(int32_t isbn, const std::string& title, const std::string& author,
                          float price, int32_t num_copies, bool editor_pick = false);

namespace validation {

constexpr int32_t kMinRating = 0;
constexpr int32_t kMaxRating = 5;

inline bool is_invalid_isbn(int32_t isbn) { return isbn < 1; }
inline bool is_invalid_rating(int32_t rating) { return rating < kMinRating || rating > kMaxRating; }
inline bool is_invalid_quantity(int64_t quantity) { return quantity < 1; }

bool is_invalid_price(float price);

// Throws FolioError for the first offending field of a book to be added.
void check_new_book(const StockBook& book);

}  // namespace validation
