#pragma once

#include "db.hpp"
#include "write_queue.hpp"
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pocket {

enum class transaction_type {
    income,
    expense
};

enum class recurrence_frequency {
    daily,
    weekly,
    monthly,
    yearly
};

const char* to_string(transaction_type type) noexcept;
const char* to_string(recurrence_frequency frequency) noexcept;

/// Throws std::invalid_argument for unknown names.
transaction_type parse_transaction_type(std::string_view text);
recurrence_frequency parse_recurrence_frequency(std::string_view text);
std::optional<recurrence_frequency> try_parse_recurrence_frequency(std::string_view text) noexcept;

/// One row of the transactions table. A template has is_recurring set; an
/// instance has parent_transaction_id set.
struct transaction_record {
    primary_key_t id = 0;
    primary_key_t wallet_id = 0;
    double amount = 0.0;
    transaction_type type = transaction_type::expense;
    std::optional<std::string> category;
    std::string date;  // YYYY-MM-DD
    std::optional<std::string> notes;
    std::optional<std::string> created_at;
    bool is_recurring = false;
    // Kept as text: rows written by older builds may carry values this
    // build does not recognise.
    std::optional<std::string> frequency;
    std::optional<std::string> recurrence_end_date;
    std::optional<primary_key_t> parent_transaction_id;

    static transaction_record from_row(const database::row_t& row);
};

// ============================================================================
// transaction_store - reads go straight to the database, writes go through
// the write queue
// ============================================================================

class transaction_store {
public:
    transaction_store(database& writer, database& reader, write_queue& queue)
        : writer_(writer), reader_(reader), queue_(queue) {}

    /// Insert a transaction and resolve with its new id.
    std::future<primary_key_t> add_transaction(transaction_record record);

    std::optional<transaction_record> find_transaction(primary_key_t id);

    /// Generated instances of a template, oldest first.
    std::vector<transaction_record> instances_of(primary_key_t template_id);

    /// Every template, newest first.
    std::vector<transaction_record> recurring_templates();

    /// Templates still generating as of `today` (no end date, or end date on
    /// or after today).
    std::vector<transaction_record> active_templates(const std::string& today);

    /// Date of the most recently generated instance, if any.
    std::optional<std::string> latest_instance_date(primary_key_t template_id);

    database& writer() { return writer_; }
    write_queue& queue() { return queue_; }

private:
    database& writer_;
    database& reader_;
    write_queue& queue_;
};

} // namespace pocket
