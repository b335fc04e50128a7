#include <sift/database.hpp>
#include <sift/log.hpp>
#include <sqlite3.h>

#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace sift {

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string path;
    std::unordered_map<std::string, sqlite3_stmt*> statements;
    int savepoint_depth = 0;

    ~Impl() { shutdown(); }

    void shutdown() {
        for (auto& [sql, stmt] : statements) {
            sqlite3_finalize(stmt);
        }
        statements.clear();
        savepoint_depth = 0;
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    Status configure() {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db,
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
            "PRAGMA cache_size=10000;",
            nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return SiftError(SiftError::Database, "SQLite setup failed: " + msg, "", path, 0);
        }
        return ok_status();
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}
Database::~Database() = default;
Database::Database(Database&&) noexcept = default;
Database& Database::operator=(Database&&) noexcept = default;

Status Database::open(const std::string& db_path) {
    close();
    impl_->path = db_path;

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return SiftError(SiftError::IO,
                "cannot create store directory: " + parent.string(), ec.message());
        }
    }

    auto attempt = [&]() -> Status {
        int rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
            impl_->shutdown();
            return SiftError(SiftError::Database, "cannot open database: " + msg, "", db_path, 0);
        }
        sqlite3_busy_timeout(impl_->db, 2000);
        return impl_->configure();
    };

    auto first = attempt();
    if (first.is_ok()) return first;

    // Corrupt or foreign file: drop it and start over once.
    log::warn("store %s unusable (%s), recreating", db_path.c_str(),
              first.error().message.c_str());
    impl_->shutdown();
    std::error_code ec;
    fs::remove(db_path, ec);
    fs::remove(db_path + "-wal", ec);
    fs::remove(db_path + "-shm", ec);
    return attempt();
}

void Database::close() {
    impl_->shutdown();
}

bool Database::is_open() const {
    return impl_->db != nullptr;
}

const std::string& Database::path() const {
    return impl_->path;
}

Status Database::exec(const std::string& sql) {
    if (!impl_->db) {
        return SiftError(SiftError::Database, "database is not open");
    }
    char* errmsg = nullptr;
    int rc = sqlite3_exec(impl_->db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        return SiftError(SiftError::Database, "SQLite exec failed: " + msg, "", impl_->path, 0);
    }
    return ok_status();
}

Result<sqlite3_stmt*> Database::prepare(const std::string& sql) {
    if (!impl_->db) {
        return SiftError(SiftError::Database, "database is not open");
    }
    auto it = impl_->statements.find(sql);
    if (it != impl_->statements.end()) {
        sqlite3_reset(it->second);
        sqlite3_clear_bindings(it->second);
        return Result<sqlite3_stmt*>::ok(it->second);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return SiftError(SiftError::Database,
            std::string("SQLite prepare failed: ") + sqlite3_errmsg(impl_->db));
    }
    impl_->statements.emplace(sql, stmt);
    return Result<sqlite3_stmt*>::ok(stmt);
}

Result<bool> Database::ensure_schema(const std::string& component,
                               const std::string& version,
                               const std::string& ddl,
                               const std::string& reset_sql) {
    SIFT_TRY(exec(
        "CREATE TABLE IF NOT EXISTS schema_info ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT"
        ");"));

    auto sel = prepare("SELECT value FROM schema_info WHERE key=?");
    if (sel.is_err()) return std::move(sel).error();
    sqlite3_stmt* stmt = sel.value();
    sqlite3_bind_text(stmt, 1, component.c_str(), -1, SQLITE_TRANSIENT);

    bool have_row = sqlite3_step(stmt) == SQLITE_ROW;
    std::string stored = have_row ? column_text(stmt, 0) : "";
    sqlite3_reset(stmt);

    bool reset = have_row && stored != version;
    if (reset) {
        log::info("%s schema %s -> %s, resetting", component.c_str(),
                  stored.c_str(), version.c_str());
        SIFT_TRY(exec(reset_sql));
    }
    SIFT_TRY(exec(ddl));

    if (!have_row || stored != version) {
        auto ins = prepare("INSERT OR REPLACE INTO schema_info (key, value) VALUES (?, ?)");
        if (ins.is_err()) return std::move(ins).error();
        sqlite3_bind_text(ins.value(), 1, component.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins.value(), 2, version.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(ins.value()) != SQLITE_DONE) {
            return SiftError(SiftError::Database,
                std::string("cannot record schema version: ") + sqlite3_errmsg(impl_->db));
        }
    }
    return Result<bool>::ok(reset);
}

static std::string savepoint_name(int depth) {
    return "sift_sp" + std::to_string(depth);
}

Status Database::begin() {
    SIFT_TRY(exec("SAVEPOINT " + savepoint_name(impl_->savepoint_depth) + ";"));
    impl_->savepoint_depth++;
    return ok_status();
}

Status Database::commit() {
    if (impl_->savepoint_depth == 0) {
        return SiftError(SiftError::Database, "commit without an open transaction");
    }
    SIFT_TRY(exec("RELEASE " + savepoint_name(impl_->savepoint_depth - 1) + ";"));
    impl_->savepoint_depth--;
    return ok_status();
}

void Database::rollback() {
    if (!impl_->db || impl_->savepoint_depth == 0) return;
    std::string name = savepoint_name(impl_->savepoint_depth - 1);
    impl_->savepoint_depth--;
    auto r = exec("ROLLBACK TO " + name + "; RELEASE " + name + ";");
    if (r.is_err()) {
        log::debug("rollback on %s: %s", impl_->path.c_str(), r.error().message.c_str());
    }
}

sqlite3* Database::handle() {
    return impl_->db;
}

std::string Database::last_error() const {
    return impl_->db ? sqlite3_errmsg(impl_->db) : "database is not open";
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* txt = sqlite3_column_text(stmt, col);
    return txt ? reinterpret_cast<const char*>(txt) : "";
}

} // namespace sift
