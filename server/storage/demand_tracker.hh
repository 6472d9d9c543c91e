#pragma once

#include <cstdint>
#include <map>
#include <vector>

// Per-book sale-miss counters kept beside the catalog. Not synchronized on
// its own: CatalogStore only touches it while holding its catalog lock.
class DemandTracker {
public:
    DemandTracker() = default;
    ~DemandTracker() = default;

    void record_miss(int32_t isbn, int64_t shortfall);
    int64_t misses(int32_t isbn) const;

    void clear(int32_t isbn);
    void clear_all();

    // Ascending isbn order; only counters above zero.
    std::vector<int32_t> isbns_in_demand() const;

private:
    std::map<int32_t, int64_t> misses_;
};
