#include "pocket/schema.hpp"
#include "pocket/log.hpp"
#include <string>
#include <utility>

namespace pocket {

namespace {

void add_missing_column(database& db,
                        const std::unordered_map<std::string, std::string>& existing,
                        const std::string& table,
                        const std::string& column,
                        const std::string& type) {
    if (existing.count(column)) return;
    LOG_INFO("schema", "Migration: adding %s.%s", table.c_str(), column.c_str());
    db.execute("ALTER TABLE " + table + " ADD COLUMN " + column + " " + type);
}

} // namespace

void ensure_schema(database& db) {
    db.execute(
        "CREATE TABLE IF NOT EXISTS wallets ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  name TEXT NOT NULL,"
        "  currency TEXT NOT NULL DEFAULT 'USD',"
        "  initial_balance REAL NOT NULL DEFAULT 0,"
        "  created_at TEXT"
        ")");

    // Older databases created this table before recurrence existed; the
    // ALTERs below fill in whatever is missing.
    db.execute(
        "CREATE TABLE IF NOT EXISTS transactions ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  wallet_id INTEGER NOT NULL,"
        "  amount REAL NOT NULL,"
        "  type TEXT NOT NULL,"
        "  category TEXT,"
        "  date TEXT NOT NULL,"
        "  notes TEXT,"
        "  created_at TEXT,"
        "  is_recurring INTEGER DEFAULT 0"
        ")");

    auto columns = db.get_table_info("transactions");
    add_missing_column(db, columns, "transactions", "recurrence_frequency", "TEXT");
    add_missing_column(db, columns, "transactions", "recurrence_end_date", "TEXT");
    add_missing_column(db, columns, "transactions", "parent_transaction_id", "INTEGER");

    db.execute("CREATE INDEX IF NOT EXISTS idx_transactions_wallet_id ON transactions(wallet_id)");
    db.execute("CREATE INDEX IF NOT EXISTS idx_transactions_date ON transactions(date)");
    db.execute("CREATE INDEX IF NOT EXISTS idx_transactions_recurring ON transactions(is_recurring)");
    db.execute(
        "CREATE UNIQUE INDEX IF NOT EXISTS idx_transactions_recurring_unique "
        "ON transactions(parent_transaction_id, date) "
        "WHERE parent_transaction_id IS NOT NULL");

    db.execute("PRAGMA user_version = " + std::to_string(current_schema_version));
    LOG_DEBUG("schema", "Schema at version %d", current_schema_version);
}

int32_t schema_version(database& db) {
    auto rows = db.query("PRAGMA user_version");
    if (rows.empty()) return 0;
    return static_cast<int32_t>(detail::as_int64(rows.front().begin()->second));
}

} // namespace pocket
