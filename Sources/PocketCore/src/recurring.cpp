#include "pocket/recurring.hpp"
#include "pocket/log.hpp"
#include <stdexcept>

namespace pocket {

local_date advance(const local_date& date, recurrence_frequency frequency, unsigned preferred_day) {
    switch (frequency) {
        case recurrence_frequency::daily: return date.add_days(1);
        case recurrence_frequency::weekly: return date.add_days(7);
        case recurrence_frequency::monthly: return date.add_months(1, preferred_day);
        case recurrence_frequency::yearly: return date.add_years(1, preferred_day);
    }
    return date.add_days(1);
}

std::vector<local_date> calculate_missing_instances(const local_date& anchor,
                                                    const local_date& today,
                                                    recurrence_frequency frequency,
                                                    const std::optional<local_date>& end_date,
                                                    size_t limit,
                                                    unsigned preferred_day) {
    std::vector<local_date> instances;
    auto current = advance(anchor, frequency, preferred_day);
    while (current <= today && instances.size() < limit) {
        if (end_date && current > *end_date) break;
        instances.push_back(current);
        current = advance(current, frequency, preferred_day);
    }
    return instances;
}

recurring_service::recurring_service(transaction_store& store, recurring_options options)
    : store_(store), options_(std::move(options)) {
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

timestamp_t recurring_service::now() const {
    return options_.clock();
}

recurring_run_report recurring_service::process_recurring_transactions() {
    recurring_run_report report;
    auto& queue = store_.queue();

    if (running_.exchange(true)) {
        LOG_INFO("recurring", "Processing already in progress, skipping");
        queue.sink().increment("recurring.run.skipped");
        report.skipped = true;
        return report;
    }
    struct running_reset {
        std::atomic<bool>& flag;
        ~running_reset() { flag.store(false); }
    } reset{running_};

    // One error boundary for the whole scan: the first failing template ends
    // the run. Already-committed batches stay committed.
    try {
        if (queue.in_drain_context()) {
            throw std::logic_error("process_recurring_transactions called from inside a queued write");
        }

        auto today = local_date_of(now());
        auto templates = store_.active_templates(today.to_string());
        report.templates_scanned = templates.size();
        LOG_DEBUG("recurring", "Scanning %zu templates as of %s", templates.size(), today.to_string().c_str());

        for (const auto& tmpl : templates) {
            report.instances_created += process_template(tmpl, today, report);
        }
    } catch (const std::exception& e) {
        report.failed = true;
        report.error = e.what();
        queue.sink().increment("recurring.run.failed");
        LOG_ERROR("recurring", "Error processing recurring transactions: %s", e.what());
    }

    if (report.instances_created > 0) {
        LOG_INFO("recurring", "Generated %zu instances across %zu templates",
                 report.instances_created, report.templates_processed);
    }
    return report;
}

size_t recurring_service::process_template(const transaction_record& tmpl,
                                           const local_date& today,
                                           recurring_run_report& report) {
    if (!tmpl.frequency) {
        LOG_WARN("recurring", "Template %lld has no frequency, skipping", static_cast<long long>(tmpl.id));
        return 0;
    }
    auto frequency = try_parse_recurrence_frequency(*tmpl.frequency);
    if (!frequency) {
        LOG_WARN("recurring", "Template %lld has unknown frequency \"%s\", skipping",
                 static_cast<long long>(tmpl.id), tmpl.frequency->c_str());
        return 0;
    }

    local_date template_date;
    try {
        template_date = local_date::parse(tmpl.date);
    } catch (const std::invalid_argument& e) {
        LOG_WARN("recurring", "Template %lld: %s, skipping", static_cast<long long>(tmpl.id), e.what());
        return 0;
    }

    std::optional<local_date> end_date;
    if (tmpl.recurrence_end_date) {
        end_date = local_date::parse(*tmpl.recurrence_end_date);
    }

    auto anchor = template_date;
    if (auto latest = store_.latest_instance_date(tmpl.id)) {
        anchor = local_date::parse(*latest);
    }

    auto dates = calculate_missing_instances(anchor, today, *frequency, end_date,
                                             options_.max_instances_per_batch, template_date.day);
    report.templates_processed++;
    if (dates.empty()) {
        return 0;
    }
    auto following = advance(dates.back(), *frequency, template_date.day);
    bool more_due = following <= today && (!end_date || following <= *end_date);
    if (dates.size() == options_.max_instances_per_batch && more_due) {
        report.templates_capped++;
        LOG_INFO("recurring", "Template %lld capped at %zu instances this run",
                 static_cast<long long>(tmpl.id), dates.size());
    }

    database& db = store_.writer();
    auto created_at = format_iso_utc(now());
    auto future = store_.queue().enqueue_write([&db, &tmpl, &dates, created_at]() -> size_t {
        transaction tx(db);
        size_t inserted = 0;
        for (const auto& date : dates) {
            db.execute(
                "INSERT INTO transactions "
                "(wallet_id, type, amount, category, date, notes, parent_transaction_id, created_at) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
                "ON CONFLICT (parent_transaction_id, date) WHERE parent_transaction_id IS NOT NULL "
                "DO NOTHING",
                {
                    tmpl.wallet_id,
                    std::string(to_string(tmpl.type)),
                    tmpl.amount,
                    detail::to_column_value(tmpl.category),
                    date.to_string(),
                    detail::to_column_value(tmpl.notes),
                    tmpl.id,
                    created_at,
                });
            inserted += static_cast<size_t>(db.changes());
        }
        tx.commit();
        return inserted;
    }, "recurring_batch_" + std::to_string(tmpl.id));

    // Waiting here keeps the captured references alive until the batch ran.
    size_t inserted = store_.queue().await_result(std::move(future));
    store_.queue().sink().increment("recurring.instances.created", inserted);
    LOG_DEBUG("recurring", "Template %lld: %zu due, %zu inserted",
              static_cast<long long>(tmpl.id), dates.size(), inserted);
    return inserted;
}

std::future<void> recurring_service::cancel_recurring_transaction(primary_key_t template_id) {
    database& db = store_.writer();
    auto today = local_date_of(now()).to_string();
    return store_.queue().enqueue_write([&db, template_id, today]() {
        db.execute(
            "UPDATE transactions SET is_recurring = 0, recurrence_end_date = ? WHERE id = ?",
            {today, template_id});
        if (db.changes() == 0) {
            throw db_error("No transaction with id " + std::to_string(template_id), db_error_kind::not_found);
        }
        LOG_INFO("recurring", "Cancelled recurring template %lld", static_cast<long long>(template_id));
    }, "cancel_recurring");
}

std::future<void> recurring_service::update_recurring_transaction(primary_key_t template_id,
                                                                  recurrence_frequency frequency,
                                                                  std::optional<local_date> end_date) {
    database& db = store_.writer();
    column_value_t end_value = end_date ? column_value_t{end_date->to_string()} : column_value_t{nullptr};
    std::string frequency_name = to_string(frequency);
    return store_.queue().enqueue_write([&db, template_id, frequency_name, end_value]() {
        db.execute(
            "UPDATE transactions SET recurrence_frequency = ?, recurrence_end_date = ? WHERE id = ?",
            {frequency_name, end_value, template_id});
        if (db.changes() == 0) {
            throw db_error("No transaction with id " + std::to_string(template_id), db_error_kind::not_found);
        }
    }, "update_recurring");
}

std::vector<transaction_record> recurring_service::get_recurring_templates() {
    return store_.recurring_templates();
}

} // namespace pocket
