#include "book.hh"
#include "errors.hh"

#include <cmath>

double StockBook::average_rating() const {
    if (num_times_rated <= 0) return 0.0;
    return static_cast<double>(total_rating) / static_cast<double>(num_times_rated);
}

Book to_book(const StockBook& stock_book) {
    Book book;
    book.isbn = stock_book.isbn;
    book.title = stock_book.title;
    book.author = stock_book.author;
    book.price = stock_book.price;
    return book;
}

std::vector<Book> to_books(const std::vector<StockBook>& stock_books) {
    std::vector<Book> books;
    books.reserve(stock_books.size());
    for (const auto& stock_book : stock_books) {
        books.push_back(to_book(stock_book));
    }
    return books;
}

StockBook make_stock_book(int32_t isbn, const std::string& title, const std::string& author,
                          float price, int32_t num_copies, bool editor_pick) {
    StockBook book;
    book.isbn = isbn;
    book.title = title;
    book.author = author;
    book.price = price;
    book.num_copies = num_copies;
    book.editor_pick = editor_pick;
    return book;
}

namespace validation {

bool is_invalid_price(float price) {
    return !std::isfinite(price) || price <= 0.0f;
}

void check_new_book(const StockBook& book) {
    if (is_invalid_isbn(book.isbn)) {
        throw FolioError::invalid_isbn(book.isbn);
    }
    if (book.title.empty()) {
        throw FolioError::invalid_argument("Book " + std::to_string(book.isbn) + " has an empty title");
    }
    if (book.author.empty()) {
        throw FolioError::invalid_argument("Book " + std::to_string(book.isbn) + " has an empty author");
    }
    if (is_invalid_price(book.price)) {
        throw FolioError::invalid_argument("Book " + std::to_string(book.isbn) + " has an invalid price");
    }
    if (is_invalid_quantity(book.num_copies)) {
        throw FolioError::invalid_quantity(book.isbn, book.num_copies);
    }
}

}  // namespace validation
