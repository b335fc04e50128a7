#pragma once

#include <sift/result.hpp>

#include <cstdint>
#include <memory>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace sift {

// Owning handle on one SQLite database file. Prepared statements are cached
// per SQL text and finalized on close().
class Database {
public:
    Database();
    ~Database();
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    // Opens (creating parent directories) with WAL journaling. A file that
    // cannot be opened or configured is deleted and recreated once.
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    const std::string& path() const;

    Status exec(const std::string& sql);

    // Returns a reset statement with cleared bindings.
    Result<sqlite3_stmt*> prepare(const std::string& sql);

    // Creates `ddl` objects and records `version` for `component` in
    // schema_info. On a version mismatch `reset_sql` runs before `ddl` and the
    // result is true.
    Result<bool> ensure_schema(const std::string& component,
                         const std::string& version,
                         const std::string& ddl,
                         const std::string& reset_sql);

    // Transactions are savepoints, so they nest; the outermost one commits.
    Status begin();
    Status commit();
    void rollback();

    sqlite3* handle();
    std::string last_error() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Rolls back on destruction unless commit() succeeded.
class Transaction {
public:
    explicit Transaction(Database& db) : db_(db) {}
    ~Transaction() {
        if (active_) db_.rollback();
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Status begin() {
        SIFT_TRY(db_.begin());
        active_ = true;
        return ok_status();
    }

    Status commit() {
        SIFT_TRY(db_.commit());
        active_ = false;
        return ok_status();
    }

private:
    Database& db_;
    bool active_ = false;
};

// Column helper: NULL text becomes "".
std::string column_text(sqlite3_stmt* stmt, int col);

} // namespace sift
