#include "catalog_store.hh"
#include "ranking.hh"
#include "../../common/errors.hh"
#include "../../common/log.h"

#include <algorithm>
#include <iterator>
#include <limits>
#include <set>
#include <string>

CatalogStore::CatalogStore() : CatalogStore(std::random_device{}()) {}

CatalogStore::CatalogStore(uint32_t seed) : rng_(seed) {
    LOG_DEBUG("Catalog store initialized");
}

size_t CatalogStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return books_.size();
}

StockBook CatalogStore::snapshot(const StockBook& live) const {
    StockBook copy = live;
    copy.num_sale_misses = demand_.misses(live.isbn);
    return copy;
}

const StockBook& CatalogStore::existing(int32_t isbn) const {
    if (validation::is_invalid_isbn(isbn)) {
        throw FolioError::invalid_isbn(isbn);
    }
    auto it = books_.find(isbn);
    if (it == books_.end()) {
        throw FolioError::invalid_isbn(isbn);
    }
    return it->second;
}

std::vector<StockBook> CatalogStore::snapshots_of(const std::vector<int32_t>& isbns) const {
    // Validate every isbn before building any result.
    for (int32_t isbn : isbns) {
        existing(isbn);
    }
    std::vector<StockBook> result;
    result.reserve(isbns.size());
    for (int32_t isbn : isbns) {
        result.push_back(snapshot(books_.at(isbn)));
    }
    return result;
}

void CatalogStore::add_books(const std::vector<StockBook>* books) {
    if (books == nullptr || books->empty()) {
        throw FolioError::null_or_empty("Book batch");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::set<int32_t> seen;
    for (const auto& book : *books) {
        validation::check_new_book(book);
        if (books_.count(book.isbn) != 0 || !seen.insert(book.isbn).second) {
            throw FolioError::duplicate_isbn(book.isbn);
        }
    }

    for (const auto& book : *books) {
        StockBook entry = make_stock_book(book.isbn, book.title, book.author, book.price,
                                          book.num_copies, book.editor_pick);
        books_.emplace(entry.isbn, std::move(entry));
    }
    LOG_DEBUG("Added %zu books (catalog size=%zu)", books->size(), books_.size());
}

void CatalogStore::add_copies(const std::vector<BookCopy>* copies) {
    if (copies == nullptr || copies->empty()) {
        throw FolioError::null_or_empty("Copy batch");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::map<int32_t, int64_t> increments;
    for (const auto& copy : *copies) {
        existing(copy.isbn);
        if (validation::is_invalid_quantity(copy.num_copies)) {
            throw FolioError::invalid_quantity(copy.isbn, copy.num_copies);
        }
        increments[copy.isbn] += copy.num_copies;
    }
    for (const auto& [isbn, increment] : increments) {
        if (books_.at(isbn).num_copies + increment > std::numeric_limits<int32_t>::max()) {
            throw FolioError::invalid_quantity(isbn, increment);
        }
    }

    for (const auto& [isbn, increment] : increments) {
        books_.at(isbn).num_copies += static_cast<int32_t>(increment);
    }
    LOG_DEBUG("Restocked %zu books", increments.size());
}

void CatalogStore::buy_books(const std::vector<BookCopy>* copies) {
    if (copies == nullptr || copies->empty()) {
        throw FolioError::null_or_empty("Purchase batch");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Repeated isbns in one batch are one purchase of the summed quantity.
    std::map<int32_t, int64_t> requested;
    for (const auto& copy : *copies) {
        existing(copy.isbn);
        if (validation::is_invalid_quantity(copy.num_copies)) {
            throw FolioError::invalid_quantity(copy.isbn, copy.num_copies);
        }
        requested[copy.isbn] += copy.num_copies;
    }

    std::string shortage;
    for (const auto& [isbn, quantity] : requested) {
        const int64_t available = books_.at(isbn).num_copies;
        if (quantity > available) {
            demand_.record_miss(isbn, quantity - available);
            if (!shortage.empty()) shortage += ", ";
            shortage += "ISBN " + std::to_string(isbn) + " requested " + std::to_string(quantity) +
                        " available " + std::to_string(available);
        }
    }
    if (!shortage.empty()) {
        LOG_DEBUG("Purchase rejected: %s", shortage.c_str());
        throw FolioError::insufficient_stock(shortage);
    }

    for (const auto& [isbn, quantity] : requested) {
        books_.at(isbn).num_copies -= static_cast<int32_t>(quantity);
    }
    LOG_DEBUG("Purchased %zu distinct books", requested.size());
}

void CatalogStore::rate_books(const std::vector<BookRating>* ratings) {
    if (ratings == nullptr) {
        throw FolioError::null_or_empty("Rating batch");
    }
    if (ratings->empty()) return;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (const auto& rating : *ratings) {
        existing(rating.isbn);
        if (validation::is_invalid_rating(rating.rating)) {
            throw FolioError::invalid_rating(rating.isbn, rating.rating);
        }
    }

    for (const auto& rating : *ratings) {
        StockBook& book = books_.at(rating.isbn);
        book.total_rating += rating.rating;
        book.num_times_rated += 1;
    }
    LOG_DEBUG("Applied %zu ratings", ratings->size());
}

void CatalogStore::update_editor_picks(const std::vector<BookEditorPick>* picks) {
    if (picks == nullptr) {
        throw FolioError::null_or_empty("Editor pick batch");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (const auto& pick : *picks) {
        existing(pick.isbn);
    }
    for (const auto& pick : *picks) {
        books_.at(pick.isbn).editor_pick = pick.editor_pick;
    }
}

void CatalogStore::remove_books(const std::vector<int32_t>* isbns) {
    if (isbns == nullptr) {
        throw FolioError::null_or_empty("ISBN batch");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (int32_t isbn : *isbns) {
        existing(isbn);
    }
    for (int32_t isbn : *isbns) {
        books_.erase(isbn);
        demand_.clear(isbn);
    }
    LOG_DEBUG("Removed %zu books (catalog size=%zu)", isbns->size(), books_.size());
}

void CatalogStore::remove_all_books() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    books_.clear();
    demand_.clear_all();
    LOG_DEBUG("Removed all books");
}

std::vector<StockBook> CatalogStore::get_books() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<StockBook> result;
    result.reserve(books_.size());
    for (const auto& entry : books_) {
        result.push_back(snapshot(entry.second));
    }
    return result;
}

std::vector<StockBook> CatalogStore::get_books_by_isbn(const std::vector<int32_t>* isbns) {
    if (isbns == nullptr) {
        throw FolioError::null_or_empty("ISBN batch");
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshots_of(*isbns);
}

std::vector<Book> CatalogStore::get_books(const std::vector<int32_t>* isbns) {
    if (isbns == nullptr) {
        throw FolioError::null_or_empty("ISBN batch");
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return to_books(snapshots_of(*isbns));
}

std::vector<StockBook> CatalogStore::get_books_in_demand() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<StockBook> result;
    for (int32_t isbn : demand_.isbns_in_demand()) {
        auto it = books_.find(isbn);
        if (it != books_.end()) {
            result.push_back(snapshot(it->second));
        }
    }
    return result;
}

std::vector<Book> CatalogStore::get_editor_picks(int32_t num_books) {
    if (num_books < 0) {
        throw FolioError::invalid_argument("Number of editor picks must not be negative, got " +
                                           std::to_string(num_books));
    }

    std::vector<Book> picks;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : books_) {
            if (entry.second.editor_pick) picks.push_back(to_book(entry.second));
        }
    }
    if (picks.size() <= static_cast<size_t>(num_books)) {
        return picks;
    }

    std::vector<Book> chosen;
    chosen.reserve(num_books);
    {
        std::lock_guard<std::mutex> rng_lock(rng_mutex_);
        std::sample(picks.begin(), picks.end(), std::back_inserter(chosen), num_books, rng_);
    }
    return chosen;
}

std::vector<Book> CatalogStore::get_top_rated_books(int32_t num_books) {
    if (num_books < 0) {
        throw FolioError::invalid_argument("Number of top rated books must not be negative, got " +
                                           std::to_string(num_books));
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<const StockBook*> candidates;
    candidates.reserve(books_.size());
    for (const auto& entry : books_) {
        candidates.push_back(&entry.second);
    }

    std::vector<Book> result;
    for (const StockBook* book : ranking::top_rated(candidates, static_cast<size_t>(num_books))) {
        result.push_back(to_book(*book));
    }
    return result;
}
