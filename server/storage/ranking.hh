#pragma once

#include <cstddef>
#include <vector>

#include "../../common/book.hh"

namespace ranking {

// True when a ranks above b: higher average rating, then lower isbn.
bool ranks_above(const StockBook& a, const StockBook& b);

// Up to k candidates, best first. Keeps a bounded heap of size k, so the
// cost is O(n log k) rather than a full sort of the catalog.
std::vector<const StockBook*> top_rated(const std::vector<const StockBook*>& candidates, size_t k);

}  // namespace ranking
