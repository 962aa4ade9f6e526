#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace pocket {

/// Structured classification of a driver failure. The write queue retries
/// `busy` and `locked`; the recurring generator relies on `constraint` for
/// the (parent_transaction_id, date) uniqueness guarantee.
enum class db_error_kind {
    busy,
    locked,
    constraint,
    not_found,
    other
};

const char* to_string(db_error_kind kind) noexcept;

/// Map a SQLite primary or extended result code to an error kind.
db_error_kind classify_result_code(int rc) noexcept;

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg,
                      db_error_kind kind = db_error_kind::other,
                      int result_code = SQLITE_ERROR)
        : std::runtime_error(msg), kind_(kind), result_code_(result_code) {}

    db_error_kind kind() const noexcept { return kind_; }
    int result_code() const noexcept { return result_code_; }

    bool is_lock_contention() const noexcept {
        return kind_ == db_error_kind::busy || kind_ == db_error_kind::locked;
    }

private:
    db_error_kind kind_;
    int result_code_;
};

/// One SQLite connection. Every statement goes through a prepared statement,
/// so failures carry the extended result code of the step that failed.
class database {
public:
    enum class open_mode {
        read_write,
        read_only   // second connection for unserialized reads
    };

    using row_t = std::unordered_map<std::string, column_value_t>;

    explicit database(const std::string& path,
                      open_mode mode = open_mode::read_write,
                      int busy_timeout_ms = 5000);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    /// Runs one statement; a returned row, if any, is discarded.
    void execute(const std::string& sql, const std::vector<column_value_t>& params = {});

    std::vector<row_t> query(const std::string& sql, const std::vector<column_value_t>& params = {});

    bool table_exists(const std::string& name) const;

    /// Column name to declared type, upper-cased.
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    /// BEGIN IMMEDIATE: the write lock is taken here, so contention shows up
    /// as SQLITE_BUSY before any statement of the batch runs.
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    /// Rows touched by the most recent INSERT/UPDATE/DELETE.
    int changes() const;
    primary_key_t last_insert_rowid() const;

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;

    void close() noexcept;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace pocket
