#pragma once

#include "calendar.hpp"
#include "db.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "recurring.hpp"
#include "reminder.hpp"
#include "reminder_service.hpp"
#include "reminder_settings.hpp"
#include "scheduler.hpp"
#include "schema.hpp"
#include "transactions.hpp"
#include "types.hpp"
#include "write_queue.hpp"

#include <memory>
#include <string>

namespace pocket {

// ============================================================================
// Configuration
// ============================================================================

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Scheduler the write queue drains on. nullptr = immediate_scheduler.
    std::shared_ptr<scheduler> sched = nullptr;

    /// How long SQLite itself waits on a lock before reporting SQLITE_BUSY.
    int busy_timeout_ms = 5000;

    write_queue_options queue_options;
    recurring_options recurring;

    /// Counter/timing sink. nullptr = a private instance.
    std::shared_ptr<pocket::metrics> metrics = nullptr;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    configuration(const std::string& p, std::shared_ptr<pocket::scheduler> s)
        : path(p), sched(std::move(s)) {}
};

// ============================================================================
// core - opens the database and wires the write path together
// ============================================================================
//
// File databases get a second, read-only connection for unserialized reads.
// In-memory databases are private to their connection, so reads share the
// writer.

class core {
public:
    explicit core(configuration config = {});
    ~core();

    core(const core&) = delete;
    core& operator=(const core&) = delete;

    database& writer() { return *db_; }
    database& reader() { return read_db_ ? *read_db_ : *db_; }
    write_queue& queue() { return *queue_; }
    transaction_store& transactions() { return *store_; }
    recurring_service& recurring() { return *recurring_; }
    pocket::metrics& sink() { return *metrics_; }

    const configuration& config() const { return config_; }

private:
    configuration config_;
    std::shared_ptr<pocket::metrics> metrics_;
    std::unique_ptr<database> db_;
    std::unique_ptr<database> read_db_;
    std::unique_ptr<write_queue> queue_;
    std::unique_ptr<transaction_store> store_;
    std::unique_ptr<recurring_service> recurring_;
};

} // namespace pocket
