#include "diffdb/persistence/database.hpp"
#include <spdlog/spdlog.h>

namespace diffdb::persistence {

// Statement implementation
Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : stmt_(other.stmt_)
    , failed_(other.failed_)
    , bind_error_(std::move(other.bind_error_))
{
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        failed_ = other.failed_;
        bind_error_ = std::move(other.bind_error_);
        other.stmt_ = nullptr;
    }
    return *this;
}

bool Statement::check_bind(int rc, int index) {
    if (rc == SQLITE_OK) return true;
    if (bind_error_.empty()) {
        bind_error_ = std::format("failed to bind parameter {}: {}", index, sqlite3_errstr(rc));
    }
    return false;
}

bool Statement::bind(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_, index, value), index);
}

bool Statement::bind(int index, std::int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_, index, value), index);
}

bool Statement::bind(int index, double value) {
    return check_bind(sqlite3_bind_double(stmt_, index, value), index);
}

bool Statement::bind(int index, std::string_view value) {
    return check_bind(sqlite3_bind_text(stmt_, index, value.data(),
                                        static_cast<int>(value.size()), SQLITE_TRANSIENT),
                      index);
}

bool Statement::bind(const char* name, int value) {
    int index = sqlite3_bind_parameter_index(stmt_, name);
    return check_bind(index > 0 ? SQLITE_OK : SQLITE_RANGE, index) && bind(index, value);
}

bool Statement::bind(const char* name, std::int64_t value) {
    int index = sqlite3_bind_parameter_index(stmt_, name);
    return check_bind(index > 0 ? SQLITE_OK : SQLITE_RANGE, index) && bind(index, value);
}

bool Statement::bind(const char* name, double value) {
    int index = sqlite3_bind_parameter_index(stmt_, name);
    return check_bind(index > 0 ? SQLITE_OK : SQLITE_RANGE, index) && bind(index, value);
}

bool Statement::bind(const char* name, std::string_view value) {
    int index = sqlite3_bind_parameter_index(stmt_, name);
    return check_bind(index > 0 ? SQLITE_OK : SQLITE_RANGE, index) && bind(index, value);
}

bool Statement::step() {
    if (!bind_error_.empty()) {
        failed_ = true;
        return false;
    }
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    failed_ = (rc != SQLITE_DONE);
    return false;
}

bool Statement::execute() {
    if (!bind_error_.empty()) {
        failed_ = true;
        return false;
    }
    int rc = sqlite3_step(stmt_);
    failed_ = (rc != SQLITE_DONE && rc != SQLITE_ROW);
    return !failed_;
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    failed_ = false;
    bind_error_.clear();
}

std::string Statement::error() const {
    if (!bind_error_.empty()) return bind_error_;
    if (!stmt_) return "invalid statement";
    return sqlite3_errmsg(sqlite3_db_handle(stmt_));
}

int Statement::column_int(int col) const {
    return sqlite3_column_int(stmt_, col);
}

std::int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    int bytes = sqlite3_column_bytes(stmt_, col);
    return {reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes)};
}

// Transaction implementation
Transaction::Transaction(Database& db)
    : db_(db)
{
    auto result = db_.begin_transaction();
    if (!result) {
        spdlog::error("Failed to begin transaction: {}", result.error().message());
        return;
    }
    began_ = true;
}

Transaction::~Transaction() {
    if (active()) {
        rollback();
    }
}

Result<void> Transaction::commit() {
    if (!began_) {
        return std::unexpected(database_error("Transaction was never started"));
    }
    if (committed_ || rolled_back_) {
        return {};
    }

    auto result = db_.commit();
    if (!result) {
        spdlog::error("Failed to commit transaction: {}", result.error().message());
        rollback();
        return result;
    }
    committed_ = true;
    return {};
}

void Transaction::rollback() {
    if (active()) {
        auto result = db_.rollback();
        if (!result) {
            spdlog::error("Failed to rollback transaction: {}", result.error().message());
        }
        rolled_back_ = true;
    }
}

// Database implementation
Database::~Database() {
    close();
}

Result<void> Database::open(const std::string& path, OpenFlags flags) {
    if (db_) {
        close();
    }

    int sqlite_flags = 0;
    switch (flags) {
        case OpenFlags::ReadOnly:
            sqlite_flags = SQLITE_OPEN_READONLY;
            break;
        case OpenFlags::ReadWrite:
            sqlite_flags = SQLITE_OPEN_READWRITE;
            break;
        case OpenFlags::ReadWriteCreate:
            sqlite_flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, sqlite_flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return std::unexpected(database_error(
            std::format("Failed to open database '{}': {}", path, error)));
    }

    path_ = path;
    read_only_ = (flags == OpenFlags::ReadOnly);
    return {};
}

void Database::close() {
    if (db_) {
        if (in_transaction()) {
            spdlog::warn("Closing '{}' with uncommitted changes, discarding them", path_);
        }
        sqlite3_close(db_);
        db_ = nullptr;
        path_.clear();
        read_only_ = false;
    }
}

Result<void> Database::create_schema() {
    Transaction txn(*this);
    if (!txn.active()) {
        return std::unexpected(database_error(
            std::format("Cannot start schema transaction: {}", last_error())));
    }

    for (const auto& sql : sql::ALL_CREATE_TABLES) {
        DIFFDB_TRY_VOID(execute(sql));
    }

    return txn.commit();
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_) {
        return std::unexpected(internal_error("Database not open"));
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                                &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected(database_error(
            std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_)));
    }

    return Statement(stmt);
}

Result<void> Database::execute(std::string_view sql) {
    if (!db_) {
        return std::unexpected(internal_error("Database not open"));
    }

    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return std::unexpected(database_error("Execute failed: " + error));
    }

    return {};
}

Result<void> Database::execute(Statement& stmt) {
    if (!stmt.is_valid()) {
        return std::unexpected(internal_error("Invalid statement"));
    }

    if (!stmt.execute()) {
        return std::unexpected(database_error("Execute failed: " + stmt.error()));
    }

    return {};
}

Result<void> Database::begin_transaction() {
    return execute("BEGIN TRANSACTION");
}

Result<void> Database::commit() {
    return execute("COMMIT");
}

Result<void> Database::rollback() {
    return execute("ROLLBACK");
}

bool Database::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

std::int64_t Database::last_insert_rowid() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

const char* Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

Result<void> Database::query(std::string_view sql, const RowCallback& callback) {
    auto stmt = DIFFDB_TRY(prepare(sql));

    while (stmt.step()) {
        auto keep_going = callback(stmt);
        if (!keep_going) return std::unexpected(keep_going.error());
        if (!*keep_going) break;
    }

    if (stmt.failed()) {
        return std::unexpected(database_error("Query failed: " + stmt.error()));
    }

    return {};
}

} // namespace diffdb::persistence
