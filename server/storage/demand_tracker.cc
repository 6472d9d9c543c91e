#include "demand_tracker.hh"
#include "../../common/log.h"

void DemandTracker::record_miss(int32_t isbn, int64_t shortfall) {
    if (shortfall <= 0) return;
    int64_t& counter = misses_[isbn];
    counter += shortfall;
    LOG_DEBUG("Recorded %ld sale misses for ISBN %d (total=%ld)", shortfall, isbn, counter);
}

int64_t DemandTracker::misses(int32_t isbn) const {
    auto it = misses_.find(isbn);
    if (it == misses_.end()) return 0;
    return it->second;
}

void DemandTracker::clear(int32_t isbn) {
    misses_.erase(isbn);
}

void DemandTracker::clear_all() {
    misses_.clear();
}

std::vector<int32_t> DemandTracker::isbns_in_demand() const {
    std::vector<int32_t> isbns;
    for (const auto& [isbn, count] : misses_) {
        if (count > 0) isbns.push_back(isbn);
    }
    return isbns;
}
