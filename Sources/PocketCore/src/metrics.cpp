#include "pocket/metrics.hpp"
#include <algorithm>

namespace pocket {

void metrics::increment(const std::string& name, uint64_t by) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += by;
}

void metrics::timing(const std::string& name, int64_t ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& t = timings_[name];
    t.count++;
    t.total_ms += ms;
    t.max_ms = std::max(t.max_ms, ms);
}

uint64_t metrics::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

timing_summary metrics::timing_stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timings_.find(name);
    return it == timings_.end() ? timing_summary{} : it->second;
}

void metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    timings_.clear();
}

} // namespace pocket
