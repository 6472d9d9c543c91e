#include "ranking.hh"

#include <queue>

namespace ranking {

bool ranks_above(const StockBook& a, const StockBook& b) {
    const double average_a = a.average_rating();
    const double average_b = b.average_rating();
    if (average_a != average_b) return average_a > average_b;
    return a.isbn < b.isbn;
}

std::vector<const StockBook*> top_rated(const std::vector<const StockBook*>& candidates, size_t k) {
    if (k == 0 || candidates.empty()) return {};

    // With ranks_above as the ordering, the top of the queue is the weakest
    // book kept so far.
    auto weaker_on_top = [](const StockBook* a, const StockBook* b) { return ranks_above(*a, *b); };
    std::priority_queue<const StockBook*, std::vector<const StockBook*>, decltype(weaker_on_top)> heap(
        weaker_on_top);

    for (const StockBook* candidate : candidates) {
        if (heap.size() < k) {
            heap.push(candidate);
        } else if (ranks_above(*candidate, *heap.top())) {
            heap.pop();
            heap.push(candidate);
        }
    }

    std::vector<const StockBook*> result(heap.size());
    for (size_t i = result.size(); i > 0; --i) {
        result[i - 1] = heap.top();
        heap.pop();
    }
    return result;
}

}  // namespace ranking
