#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace pocket {

// ============================================================================
// metrics - named counters and timings
// ============================================================================
//
// Shared by the write queue and the recurring generator. All methods are
// safe to call from any thread.

struct timing_summary {
    uint64_t count = 0;
    int64_t total_ms = 0;
    int64_t max_ms = 0;
};

class metrics {
public:
    void increment(const std::string& name, uint64_t by = 1);
    void timing(const std::string& name, int64_t ms);

    [[nodiscard]] uint64_t counter(const std::string& name) const;
    [[nodiscard]] timing_summary timing_stats(const std::string& name) const;

    void reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
    std::map<std::string, timing_summary> timings_;
};

} // namespace pocket
