#include "pocket/transactions.hpp"
#include <stdexcept>

namespace pocket {

const char* to_string(transaction_type type) noexcept {
    switch (type) {
        case transaction_type::income: return "income";
        case transaction_type::expense: return "expense";
    }
    return "expense";
}

const char* to_string(recurrence_frequency frequency) noexcept {
    switch (frequency) {
        case recurrence_frequency::daily: return "daily";
        case recurrence_frequency::weekly: return "weekly";
        case recurrence_frequency::monthly: return "monthly";
        case recurrence_frequency::yearly: return "yearly";
    }
    return "daily";
}

transaction_type parse_transaction_type(std::string_view text) {
    if (text == "income") return transaction_type::income;
    if (text == "expense") return transaction_type::expense;
    throw std::invalid_argument("Unknown transaction type \"" + std::string(text) + "\"");
}

std::optional<recurrence_frequency> try_parse_recurrence_frequency(std::string_view text) noexcept {
    if (text == "daily") return recurrence_frequency::daily;
    if (text == "weekly") return recurrence_frequency::weekly;
    if (text == "monthly") return recurrence_frequency::monthly;
    if (text == "yearly") return recurrence_frequency::yearly;
    return std::nullopt;
}

recurrence_frequency parse_recurrence_frequency(std::string_view text) {
    auto parsed = try_parse_recurrence_frequency(text);
    if (!parsed) {
        throw std::invalid_argument("Unknown recurrence frequency \"" + std::string(text) + "\"");
    }
    return *parsed;
}

transaction_record transaction_record::from_row(const database::row_t& row) {
    auto get = [&row](const char* column) -> column_value_t {
        auto it = row.find(column);
        return it == row.end() ? column_value_t{nullptr} : it->second;
    };

    transaction_record r;
    r.id = detail::as_int64(get("id"));
    r.wallet_id = detail::as_int64(get("wallet_id"));
    r.amount = detail::as_double(get("amount"));
    r.type = parse_transaction_type(detail::as_string(get("type")));
    r.category = detail::as_optional_string(get("category"));
    r.date = detail::as_string(get("date"));
    r.notes = detail::as_optional_string(get("notes"));
    r.created_at = detail::as_optional_string(get("created_at"));
    r.is_recurring = detail::as_optional_int64(get("is_recurring")).value_or(0) != 0;
    r.frequency = detail::as_optional_string(get("recurrence_frequency"));
    r.recurrence_end_date = detail::as_optional_string(get("recurrence_end_date"));
    r.parent_transaction_id = detail::as_optional_int64(get("parent_transaction_id"));
    return r;
}

std::future<primary_key_t> transaction_store::add_transaction(transaction_record record) {
    database& db = writer_;
    return queue_.enqueue_write([&db, record = std::move(record)]() -> primary_key_t {
        db.execute(
            "INSERT INTO transactions "
            "(wallet_id, amount, type, category, date, notes, created_at, is_recurring, "
            " recurrence_frequency, recurrence_end_date, parent_transaction_id) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            {
                record.wallet_id,
                record.amount,
                std::string(to_string(record.type)),
                detail::to_column_value(record.category),
                record.date,
                detail::to_column_value(record.notes),
                detail::to_column_value(record.created_at),
                detail::to_column_value(record.is_recurring),
                detail::to_column_value(record.frequency),
                detail::to_column_value(record.recurrence_end_date),
                detail::to_column_value(record.parent_transaction_id),
            });
        return db.last_insert_rowid();
    }, "add_transaction");
}

std::optional<transaction_record> transaction_store::find_transaction(primary_key_t id) {
    auto rows = reader_.query("SELECT * FROM transactions WHERE id = ?", {id});
    if (rows.empty()) return std::nullopt;
    return transaction_record::from_row(rows.front());
}

std::vector<transaction_record> transaction_store::instances_of(primary_key_t template_id) {
    auto rows = reader_.query(
        "SELECT * FROM transactions WHERE parent_transaction_id = ? ORDER BY date ASC",
        {template_id});
    std::vector<transaction_record> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(transaction_record::from_row(row));
    }
    return out;
}

std::vector<transaction_record> transaction_store::recurring_templates() {
    auto rows = reader_.query("SELECT * FROM transactions WHERE is_recurring = 1 ORDER BY date DESC");
    std::vector<transaction_record> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(transaction_record::from_row(row));
    }
    return out;
}

std::vector<transaction_record> transaction_store::active_templates(const std::string& today) {
    auto rows = reader_.query(
        "SELECT * FROM transactions "
        "WHERE is_recurring = 1 "
        "AND (recurrence_end_date IS NULL OR recurrence_end_date >= ?) "
        "ORDER BY id ASC",
        {today});
    std::vector<transaction_record> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(transaction_record::from_row(row));
    }
    return out;
}

std::optional<std::string> transaction_store::latest_instance_date(primary_key_t template_id) {
    auto rows = reader_.query(
        "SELECT date FROM transactions WHERE parent_transaction_id = ? ORDER BY date DESC LIMIT 1",
        {template_id});
    if (rows.empty()) return std::nullopt;
    return detail::as_string(rows.front().at("date"));
}

} // namespace pocket
