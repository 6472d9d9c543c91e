#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../common/book.hh"
#include "../common/errors.hh"

// Small catalog builders shared by the test suites.

inline StockBook TestBook(int32_t isbn, int32_t copies = 5, bool editor_pick = false) {
    return make_stock_book(isbn, "Title " + std::to_string(isbn), "Author " + std::to_string(isbn),
                           10.0f + static_cast<float>(isbn), copies, editor_pick);
}

inline std::vector<StockBook> TestBooks(const std::vector<int32_t>& isbns, int32_t copies = 5) {
    std::vector<StockBook> books;
    for (int32_t isbn : isbns) {
        books.push_back(TestBook(isbn, copies));
    }
    return books;
}

inline std::vector<int32_t> IsbnsOf(const std::vector<Book>& books) {
    std::vector<int32_t> isbns;
    for (const auto& book : books) {
        isbns.push_back(book.isbn);
    }
    return isbns;
}

inline std::vector<int32_t> IsbnsOf(const std::vector<StockBook>& books) {
    std::vector<int32_t> isbns;
    for (const auto& book : books) {
        isbns.push_back(book.isbn);
    }
    return isbns;
}

// Expects `call` to throw a FolioError of `expected_kind`.
#define EXPECT_FOLIO_ERROR(call, expected_kind)                                   \
    do {                                                                          \
        try {                                                                     \
            call;                                                                 \
            ADD_FAILURE() << #call " did not throw";                              \
        } catch (const FolioError& e) {                                           \
            EXPECT_STREQ(ErrorKindToString(e.kind()), ErrorKindToString(expected_kind)) \
                << e.what();                                                      \
        }                                                                         \
    } while (0)
