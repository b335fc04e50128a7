#include <sift/symbol_index.hpp>
#include <sift/text.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <map>

namespace sift {

namespace {

double name_match_score(const std::string& lower_name, const std::string& token) {
    if (lower_name == token) return 1.0;
    if (lower_name.compare(0, token.size(), token) == 0) return 0.6;
    if (lower_name.find(token) != std::string::npos) return 0.3;
    return 0.0;
}

Symbol read_symbol_row(sqlite3_stmt* s) {
    Symbol sym;
    sym.pointer_id = column_text(s, 0);
    sym.path = column_text(s, 1);
    sym.name = column_text(s, 2);
    sym.kind = column_text(s, 3);
    sym.start_line = sqlite3_column_int(s, 4);
    sym.end_line = sqlite3_column_int(s, 5);
    return sym;
}

} // namespace

Result<bool> SymbolIndex::open() {
    return db_.ensure_schema("symbols", "1",
        "CREATE TABLE IF NOT EXISTS symbols ("
        "  pointer_id TEXT PRIMARY KEY,"
        "  path TEXT NOT NULL,"
        "  name TEXT NOT NULL,"
        "  lname TEXT NOT NULL,"
        "  kind TEXT NOT NULL,"
        "  start_line INTEGER NOT NULL,"
        "  end_line INTEGER NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_symbols_path ON symbols(path);",
        "DROP TABLE IF EXISTS symbols;");
}

Status SymbolIndex::replace(const std::string& path, const std::vector<Symbol>& symbols) {
    Transaction tx(db_);
    SIFT_TRY(tx.begin());
    SIFT_TRY(remove(path));

    auto stmt = db_.prepare(
        "INSERT OR REPLACE INTO symbols "
        "(pointer_id, path, name, lname, kind, start_line, end_line) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    for (const auto& sym : symbols) {
        std::string lname = to_lower(sym.name);
        sqlite3_bind_text(s, 1, sym.pointer_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 2, sym.path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 3, sym.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 4, lname.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 5, sym.kind.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(s, 6, sym.start_line);
        sqlite3_bind_int(s, 7, sym.end_line);
        int rc = sqlite3_step(s);
        sqlite3_reset(s);
        if (rc != SQLITE_DONE) {
            return SiftError(SiftError::Database,
                "cannot store symbol " + sym.pointer_id + ": " + db_.last_error());
        }
    }
    return tx.commit();
}

Status SymbolIndex::remove(const std::string& path) {
    auto stmt = db_.prepare("DELETE FROM symbols WHERE path=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database,
            "cannot drop symbols of " + path + ": " + db_.last_error());
    }
    return ok_status();
}

Result<std::vector<SymbolHit>> SymbolIndex::lookup(const std::vector<std::string>& tokens,
                                                   size_t limit) {
    std::map<std::string, SymbolHit> best;

    auto stmt = db_.prepare(
        "SELECT pointer_id, path, name, kind, start_line, end_line, lname "
        "FROM symbols WHERE instr(lname, ?) > 0 ORDER BY pointer_id");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    for (const auto& tok : tokens) {
        sqlite3_reset(s);
        sqlite3_clear_bindings(s);
        sqlite3_bind_text(s, 1, tok.c_str(), -1, SQLITE_TRANSIENT);
        int rc;
        while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
            double score = name_match_score(column_text(s, 6), tok);
            Symbol sym = read_symbol_row(s);
            auto it = best.find(sym.pointer_id);
            if (it == best.end()) {
                std::string key = sym.pointer_id;
                best.emplace(key, SymbolHit{std::move(sym), score});
            } else if (score > it->second.score) {
                it->second.score = score;
            }
        }
        if (rc != SQLITE_DONE) {
            sqlite3_reset(s);
            return SiftError(SiftError::Database, "symbol lookup failed: " + db_.last_error());
        }
    }
    sqlite3_reset(s);

    std::vector<SymbolHit> hits;
    hits.reserve(best.size());
    for (auto& [id, hit] : best) hits.push_back(std::move(hit));
    std::stable_sort(hits.begin(), hits.end(), [](const SymbolHit& a, const SymbolHit& b) {
        return a.score > b.score;
    });
    if (hits.size() > limit) hits.resize(limit);
    return Result<std::vector<SymbolHit>>::ok(std::move(hits));
}

Result<std::vector<Symbol>> SymbolIndex::symbols_in(const std::string& path) {
    auto stmt = db_.prepare(
        "SELECT pointer_id, path, name, kind, start_line, end_line "
        "FROM symbols WHERE path=? ORDER BY start_line, pointer_id");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<Symbol> out;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        out.push_back(read_symbol_row(s));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database, "symbol listing failed: " + db_.last_error());
    }
    return Result<std::vector<Symbol>>::ok(std::move(out));
}

} // namespace sift
