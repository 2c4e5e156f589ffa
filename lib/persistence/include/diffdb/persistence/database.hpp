#pragma once

#include "diffdb/persistence/schema.hpp"
#include <diffdb/core/types.hpp>
#include <diffdb/core/result.hpp>
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <functional>
#include <optional>
#include <type_traits>

namespace diffdb::persistence {

// Forward declarations
class Database;
class Statement;
class Transaction;

// SQLite statement wrapper (RAII)
//
// Bind failures are sticky: once a bind fails, step() and execute() report
// failure and error() describes the first failing bind.
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Binding parameters
    bool bind(int index, int value);
    bool bind(int index, std::int64_t value);
    bool bind(int index, double value);
    bool bind(int index, std::string_view value);

    // Named parameter binding (":name")
    bool bind(const char* name, int value);
    bool bind(const char* name, std::int64_t value);
    bool bind(const char* name, double value);
    bool bind(const char* name, std::string_view value);

    // Execution
    bool step();                    // Execute one step, returns true if row available
    bool execute();                 // Execute a statement that returns no rows
    void reset();                   // Reset for re-execution

    // True once step()/execute() ended on anything other than ROW/DONE
    [[nodiscard]] bool failed() const { return failed_; }
    [[nodiscard]] std::string error() const;

    // Column access
    [[nodiscard]] int column_int(int col) const;
    [[nodiscard]] std::int64_t column_int64(int col) const;
    [[nodiscard]] double column_double(int col) const;
    [[nodiscard]] std::string column_text(int col) const;

    [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

private:
    bool check_bind(int rc, int index);

    sqlite3_stmt* stmt_{nullptr};
    bool failed_{false};
    std::string bind_error_;
};

// Transaction wrapper (RAII)
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] bool active() const { return began_ && !committed_ && !rolled_back_; }

    [[nodiscard]] Result<void> commit();
    void rollback();

private:
    Database& db_;
    bool began_{false};
    bool committed_{false};
    bool rolled_back_{false};
};

// How to open the underlying file
enum class OpenFlags {
    ReadOnly,
    ReadWrite,          // File must already exist
    ReadWriteCreate,
};

// Database connection
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Open/close
    [[nodiscard]] Result<void> open(const std::string& path, OpenFlags flags);
    void close();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    [[nodiscard]] bool is_read_only() const { return read_only_; }
    [[nodiscard]] const std::string& path() const { return path_; }

    // Schema management
    [[nodiscard]] Result<void> create_schema();

    // Statement preparation
    [[nodiscard]] Result<Statement> prepare(std::string_view sql);

    // Direct execution
    [[nodiscard]] Result<void> execute(std::string_view sql);
    [[nodiscard]] Result<void> execute(Statement& stmt);

    // Transaction support
    [[nodiscard]] Result<void> begin_transaction();
    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();
    [[nodiscard]] bool in_transaction() const;

    // Utility
    [[nodiscard]] std::int64_t last_insert_rowid() const;
    [[nodiscard]] int changes() const;
    [[nodiscard]] const char* last_error() const;

    // Query helpers
    template<typename T>
    [[nodiscard]] Result<std::optional<T>> query_scalar(std::string_view sql);

    // Iteration helpers
    using RowCallback = std::function<Result<bool>(Statement&)>;  // false stops the scan
    [[nodiscard]] Result<void> query(std::string_view sql, const RowCallback& callback);

private:
    sqlite3* db_{nullptr};
    std::string path_;
    bool read_only_{false};
};

// Template implementations
template<typename T>
Result<std::optional<T>> Database::query_scalar(std::string_view sql) {
    auto stmt = DIFFDB_TRY(prepare(sql));

    if (!stmt.step()) {
        if (stmt.failed()) {
            return std::unexpected(database_error(stmt.error()));
        }
        return std::optional<T>{};
    }

    if constexpr (std::is_same_v<T, int>) {
        return std::optional<T>{stmt.column_int(0)};
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return std::optional<T>{stmt.column_int64(0)};
    } else if constexpr (std::is_same_v<T, double>) {
        return std::optional<T>{stmt.column_double(0)};
    } else if constexpr (std::is_same_v<T, std::string>) {
        return std::optional<T>{stmt.column_text(0)};
    } else {
        static_assert(sizeof(T) == 0, "Unsupported type for query_scalar");
    }
}

} // namespace diffdb::persistence
