#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marrow {

/// One shared SQLite connection in serialized threading mode.
class database {
public:
    explicit database(const std::string& path);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // conflict_columns: if non-empty, generates ON CONFLICT (...) DO UPDATE SET for upsert
    int64_t insert(const std::string& table,
                   const std::vector<std::pair<std::string, column_value_t>>& values,
                   const std::vector<std::string>& conflict_columns = {});

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// BEGIN IMMEDIATE, waiting out a busy database.
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows modified by the most recent statement.
    int changes() const { return sqlite3_changes(db_); }

private:
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);

    sqlite3* db_ = nullptr;
    std::string path_;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

// Helpers for moving values between SQLite columns and JSON.
inline std::string column_text(const column_value_t& v) {
    if (auto s = std::get_if<std::string>(&v)) return *s;
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) return std::to_string(*d);
    return {};
}

inline int64_t column_int(const column_value_t& v) {
    if (auto i = std::get_if<int64_t>(&v)) return *i;
    if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (auto s = std::get_if<std::string>(&v)) return std::stoll(*s);
    return 0;
}

} // namespace marrow
