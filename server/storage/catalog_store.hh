#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <vector>

#include "../../common/book.hh"
#include "../../common/bookstore.hh"
#include "demand_tracker.hh"

/**
 * @brief
 * In-memory catalog shared by every connection of the server.
 *
 * Each batch runs validate-then-commit under one exclusive lock, so a batch
 * is either applied as a whole or not at all, and no reader sees it half
 * applied. The single exception is buy_books: when stock is short the
 * batch fails, but the shortfall is still recorded as sale misses.
 * Queries take the lock shared and return copies.
 */
class CatalogStore : public BookStore, public StockManager {
public:
    CatalogStore();
    explicit CatalogStore(uint32_t seed);
    ~CatalogStore() override = default;

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    // StockManager
    void add_books(const std::vector<StockBook>* books) override;
    void add_copies(const std::vector<BookCopy>* copies) override;
    std::vector<StockBook> get_books() override;
    std::vector<StockBook> get_books_by_isbn(const std::vector<int32_t>* isbns) override;
    void update_editor_picks(const std::vector<BookEditorPick>* picks) override;
    std::vector<StockBook> get_books_in_demand() override;
    void remove_books(const std::vector<int32_t>* isbns) override;
    void remove_all_books() override;

    // BookStore
    void buy_books(const std::vector<BookCopy>* copies) override;
    std::vector<Book> get_books(const std::vector<int32_t>* isbns) override;
    std::vector<Book> get_editor_picks(int32_t num_books) override;
    void rate_books(const std::vector<BookRating>* ratings) override;
    std::vector<Book> get_top_rated_books(int32_t num_books) override;

    size_t size() const;

private:
    // Callers hold mutex_ (shared or exclusive).
    StockBook snapshot(const StockBook& live) const;
    const StockBook& existing(int32_t isbn) const;
    std::vector<StockBook> snapshots_of(const std::vector<int32_t>& isbns) const;

    mutable std::shared_mutex mutex_;
    std::map<int32_t, StockBook> books_;
    DemandTracker demand_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};
