#pragma once

#include "calendar.hpp"
#include "transactions.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pocket {

constexpr size_t default_max_instances_per_batch = 100;

struct recurring_options {
    /// Upper bound on instances materialized per template per run. The rest
    /// are picked up by the next run.
    size_t max_instances_per_batch = default_max_instances_per_batch;

    /// Source of "now". Defaults to the system clock.
    std::function<timestamp_t()> clock;
};

/// Step `date` forward by one recurrence period. Monthly and yearly steps
/// land on `preferred_day` (the template's day of month) clamped to the
/// target month, so a 31st-of-month schedule does not drift after February.
local_date advance(const local_date& date, recurrence_frequency frequency, unsigned preferred_day = 0);

/// Dates strictly after `anchor` that are due by `today` and not past
/// `end_date`, oldest first, at most `limit` of them.
std::vector<local_date> calculate_missing_instances(const local_date& anchor,
                                                    const local_date& today,
                                                    recurrence_frequency frequency,
                                                    const std::optional<local_date>& end_date,
                                                    size_t limit = default_max_instances_per_batch,
                                                    unsigned preferred_day = 0);

struct recurring_run_report {
    bool skipped = false;             // another run was already in progress
    bool failed = false;              // the run stopped early on an error
    size_t templates_scanned = 0;
    size_t templates_processed = 0;
    size_t templates_capped = 0;      // hit max_instances_per_batch
    size_t instances_created = 0;
    std::string error;
};

// ============================================================================
// recurring_service - materializes due instances of recurring templates
// ============================================================================
//
// Anchors are always recomputed from what is already in the database, so a
// run that is capped or aborted loses nothing: the next run resumes from the
// newest persisted instance. Insertion is keyed on the
// (parent_transaction_id, date) unique index, which makes re-running the
// same computation a no-op.
//
// A failure on one template ends the whole run; templates after it wait for
// the next invocation.

class recurring_service {
public:
    recurring_service(transaction_store& store, recurring_options options = {});

    recurring_service(const recurring_service&) = delete;
    recurring_service& operator=(const recurring_service&) = delete;

    /// Scan all active templates and insert their missing instances. Blocks
    /// until the queued inserts complete. A call made while another run is in
    /// progress returns immediately with `skipped` set.
    recurring_run_report process_recurring_transactions();

    /// Stop a template from generating: clears is_recurring and sets its end
    /// date to today. Existing instances are kept. Resolves with a not_found
    /// db_error if the template does not exist.
    std::future<void> cancel_recurring_transaction(primary_key_t template_id);

    /// Change the schedule of an existing template.
    std::future<void> update_recurring_transaction(primary_key_t template_id,
                                                   recurrence_frequency frequency,
                                                   std::optional<local_date> end_date = std::nullopt);

    std::vector<transaction_record> get_recurring_templates();

    bool is_running() const { return running_.load(); }

private:
    timestamp_t now() const;

    /// Returns the number of instances inserted for `tmpl`.
    size_t process_template(const transaction_record& tmpl,
                            const local_date& today,
                            recurring_run_report& report);

    transaction_store& store_;
    recurring_options options_;
    std::atomic<bool> running_{false};
};

} // namespace pocket
