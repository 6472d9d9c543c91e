#include <gtest/gtest.h>

#include <vector>

#include "../server/storage/ranking.hh"
#include "test_util.hh"

namespace {

StockBook Rated(int32_t isbn, int64_t total, int64_t times) {
    StockBook book = TestBook(isbn);
    book.total_rating = total;
    book.num_times_rated = times;
    return book;
}

std::vector<int32_t> Ranked(const std::vector<StockBook>& books, size_t k) {
    std::vector<const StockBook*> candidates;
    for (const auto& book : books) {
        candidates.push_back(&book);
    }
    std::vector<int32_t> isbns;
    for (const StockBook* book : ranking::top_rated(candidates, k)) {
        isbns.push_back(book->isbn);
    }
    return isbns;
}

}  // namespace

TEST(RankingTest, HigherAverageRanksFirst) {
    EXPECT_TRUE(ranking::ranks_above(Rated(9, 10, 2), Rated(1, 4, 1)));
    EXPECT_FALSE(ranking::ranks_above(Rated(1, 4, 1), Rated(9, 10, 2)));
}

TEST(RankingTest, TiesBreakByAscendingIsbn) {
    EXPECT_TRUE(ranking::ranks_above(Rated(2, 8, 2), Rated(5, 4, 1)));
    EXPECT_FALSE(ranking::ranks_above(Rated(5, 4, 1), Rated(2, 8, 2)));
    EXPECT_FALSE(ranking::ranks_above(Rated(3, 0, 0), Rated(3, 0, 0)));
}

TEST(RankingTest, SelectsBestKInOrder) {
    std::vector<StockBook> books = {
        Rated(1, 3, 1), Rated(2, 0, 0), Rated(3, 5, 1), Rated(4, 9, 2), Rated(5, 2, 1), Rated(6, 5, 1),
    };
    EXPECT_EQ(Ranked(books, 3), (std::vector<int32_t>{3, 6, 4}));
    EXPECT_EQ(Ranked(books, 1), (std::vector<int32_t>{3}));
}

TEST(RankingTest, LargeKReturnsWholeCatalogOrdered) {
    std::vector<StockBook> books = {Rated(4, 1, 1), Rated(2, 0, 0), Rated(1, 5, 1), Rated(3, 0, 0)};
    EXPECT_EQ(Ranked(books, 100), (std::vector<int32_t>{1, 4, 2, 3}));
}

TEST(RankingTest, EmptyResults) {
    std::vector<StockBook> books = {Rated(1, 5, 1)};
    EXPECT_TRUE(Ranked(books, 0).empty());
    EXPECT_TRUE(Ranked({}, 4).empty());
}

TEST(RankingTest, UnchangedInputGivesSameOrder) {
    std::vector<StockBook> books;
    for (int32_t isbn = 50; isbn > 0; --isbn) {
        books.push_back(Rated(isbn, isbn % 3, 1));
    }
    EXPECT_EQ(Ranked(books, 10), Ranked(books, 10));
    std::vector<int32_t> top = Ranked(books, 3);
    EXPECT_EQ(top, (std::vector<int32_t>{2, 5, 8}));
}
