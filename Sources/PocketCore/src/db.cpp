#include "pocket/db.hpp"
#include "pocket/log.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>
#include <utility>

namespace pocket {

const char* to_string(db_error_kind kind) noexcept {
    switch (kind) {
        case db_error_kind::busy: return "busy";
        case db_error_kind::locked: return "locked";
        case db_error_kind::constraint: return "constraint";
        case db_error_kind::not_found: return "not_found";
        case db_error_kind::other: return "other";
    }
    return "other";
}

db_error_kind classify_result_code(int rc) noexcept {
    switch (rc & 0xff) {
        case SQLITE_BUSY: return db_error_kind::busy;
        case SQLITE_LOCKED: return db_error_kind::locked;
        case SQLITE_CONSTRAINT: return db_error_kind::constraint;
        case SQLITE_NOTFOUND: return db_error_kind::not_found;
        default: return db_error_kind::other;
    }
}

namespace {

// Lock contention is expected under load and retried upstream, so it is
// logged one level lower than real failures.
[[noreturn]] void throw_db_error(sqlite3* conn, const char* stage, int rc, const std::string& sql) {
    int code = conn ? sqlite3_extended_errcode(conn) : rc;
    if ((code & 0xff) == SQLITE_OK) code = rc;
    std::string message = conn ? sqlite3_errmsg(conn) : sqlite3_errstr(rc);
    auto kind = classify_result_code(code);

    if (kind == db_error_kind::busy || kind == db_error_kind::locked) {
        LOG_WARN("db", "%s failed (%s): %s [%s]", stage, to_string(kind), message.c_str(), sql.c_str());
    } else {
        LOG_ERROR("db", "%s failed (%s): %s [%s]", stage, to_string(kind), message.c_str(), sql.c_str());
    }
    throw db_error(std::string(stage) + " failed: " + message, kind, code);
}

class statement {
public:
    statement(sqlite3* conn, const std::string& sql) : conn_(conn), sql_(sql) {
        int rc = sqlite3_prepare_v2(conn_, sql.c_str(), static_cast<int>(sql.size()), &stmt_, nullptr);
        if (rc != SQLITE_OK) throw_db_error(conn_, "prepare", rc, sql_);
    }

    ~statement() { sqlite3_finalize(stmt_); }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind_all(const std::vector<column_value_t>& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            bind(static_cast<int>(i) + 1, params[i]);
        }
    }

    /// True while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw_db_error(conn_, "step", rc, sql_);
    }

    int column_count() const { return sqlite3_column_count(stmt_); }
    const char* column_name(int i) const { return sqlite3_column_name(stmt_, i); }

    column_value_t column(int i) const {
        switch (sqlite3_column_type(stmt_, i)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, i);
            case SQLITE_TEXT: {
                auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                if (!text) return std::string();
                return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, i)));
            }
            default:
                return nullptr;
        }
    }

    std::string column_text(int i) const {
        auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
        return text ? std::string(text) : std::string();
    }

private:
    void bind(int index, const column_value_t& value) {
        int rc = std::visit([&](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt_, index, v);
            } else {
                return sqlite3_bind_text(stmt_, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, value);
        if (rc != SQLITE_OK) throw_db_error(conn_, "bind", rc, sql_);
    }

    sqlite3* conn_;
    const std::string& sql_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

database::database(const std::string& path, open_mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= mode == open_mode::read_only ? SQLITE_OPEN_READONLY
                                          : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        close();
        LOG_ERROR("db", "cannot open %s: %s", path.c_str(), message.c_str());
        throw db_error("cannot open " + path + ": " + message, classify_result_code(rc), rc);
    }
    sqlite3_extended_result_codes(db_, 1);

    // SQLite waits this long on a held lock before returning SQLITE_BUSY;
    // the write queue retries whatever gets through.
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    try {
        execute("PRAGMA foreign_keys = ON");
        execute("PRAGMA temp_store = MEMORY");
        if (mode == open_mode::read_write) {
            execute("PRAGMA journal_mode = WAL");
            execute("PRAGMA synchronous = NORMAL");
        }
    } catch (const db_error&) {
        close();
        throw;
    }

    LOG_DEBUG("db", "opened %s (%s, busy timeout %dms)", path.c_str(),
              mode == open_mode::read_only ? "read-only" : "read-write", busy_timeout_ms);
}

database::~database() {
    close();
}

database::database(database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)), mode_(other.mode_) {}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        mode_ = other.mode_;
    }
    return *this;
}

void database::close() noexcept {
    if (!db_) return;
    if (mode_ == open_mode::read_write) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    }
    sqlite3_close(db_);
    db_ = nullptr;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);
    stmt.step();
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);

    std::vector<row_t> rows;
    const int width = stmt.column_count();
    while (stmt.step()) {
        row_t row;
        row.reserve(static_cast<size_t>(width));
        for (int i = 0; i < width; ++i) {
            row.emplace(stmt.column_name(i), stmt.column(i));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

bool database::table_exists(const std::string& name) const {
    const std::string sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?";
    statement stmt(db_, sql);
    stmt.bind_all({name});
    return stmt.step();
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) const {
    // Rows are (cid, name, type, notnull, dflt_value, pk).
    const std::string sql = "PRAGMA table_info(" + table + ")";
    statement stmt(db_, sql);

    std::unordered_map<std::string, std::string> columns;
    while (stmt.step()) {
        auto type = stmt.column_text(2);
        std::transform(type.begin(), type.end(), type.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        columns.emplace(stmt.column_text(1), std::move(type));
    }
    return columns;
}

void database::begin_transaction() {
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

int database::changes() const {
    return sqlite3_changes(db_);
}

primary_key_t database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (completed_ || !db_.is_in_transaction()) return;
    try {
        db_.rollback();
    } catch (const db_error& e) {
        LOG_ERROR("db", "rollback while unwinding failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace pocket
