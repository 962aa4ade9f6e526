#include "pocket/pocket.hpp"

namespace pocket {

std::atomic<log_level> g_log_level{log_level::off};

core::core(configuration config)
    : config_(std::move(config)) {
    metrics_ = config_.metrics ? config_.metrics : std::make_shared<pocket::metrics>();

    db_ = std::make_unique<database>(config_.path, database::open_mode::read_write, config_.busy_timeout_ms);
    ensure_schema(*db_);

    if (config_.path != ":memory:" && !config_.path.empty()) {
        read_db_ = std::make_unique<database>(config_.path, database::open_mode::read_only, config_.busy_timeout_ms);
    }

    queue_ = std::make_unique<write_queue>(config_.sched, config_.queue_options, metrics_);
    store_ = std::make_unique<transaction_store>(*db_, reader(), *queue_);
    recurring_ = std::make_unique<recurring_service>(*store_, config_.recurring);

    LOG_DEBUG("core", "Opened %s (schema v%d)", config_.path.c_str(), schema_version(*db_));
}

core::~core() {
    // Queued operations reference db_; let them finish first. Waiting on the
    // scheduler's own context would never return: a manual_scheduler owner
    // must pump its pending work before destroying the core.
    if (queue_ && !queue_->executor().is_on_thread()) {
        queue_->wait_idle();
    }
}

} // namespace pocket
