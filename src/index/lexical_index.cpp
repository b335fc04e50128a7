#include <sift/lexical_index.hpp>
#include <sift/log.hpp>
#include <sift/text.hpp>
#include <sqlite3.h>

namespace sift {

const char* fulltext_backend_name(FulltextBackend b) {
    switch (b) {
        case FulltextBackend::Fts5:      return "fts5";
        case FulltextBackend::Substring: return "substring";
    }
    return "unknown";
}

LexicalIndex::LexicalIndex(Database& db, std::string mode)
    : db_(db), mode_(std::move(mode)) {}

bool LexicalIndex::fts5_available(Database& db) {
    auto check = db.exec("CREATE VIRTUAL TABLE IF NOT EXISTS temp.sift_fts5_check "
                         "USING fts5(x);");
    if (check.is_err()) {
        log::debug("fts5 unavailable: %s", check.error().message.c_str());
        return false;
    }
    auto drop = db.exec("DROP TABLE IF EXISTS temp.sift_fts5_check;");
    if (drop.is_err()) {
        log::debug("fts5 check cleanup: %s", drop.error().message.c_str());
    }
    return true;
}

Result<bool> LexicalIndex::open() {
    if (mode_ == "substring") {
        backend_ = FulltextBackend::Substring;
    } else {
        bool have_fts = fts5_available(db_);
        if (!have_fts && mode_ == "fts5") {
            return SiftError(SiftError::Unavailable,
                "SQLite was built without FTS5",
                "set [index] fulltext = \"auto\" or \"substring\"");
        }
        backend_ = have_fts ? FulltextBackend::Fts5 : FulltextBackend::Substring;
    }

    std::string ddl = backend_ == FulltextBackend::Fts5
        ? "CREATE VIRTUAL TABLE IF NOT EXISTS docs USING fts5(path UNINDEXED, content);"
        : "CREATE TABLE IF NOT EXISTS docs (path TEXT PRIMARY KEY, content TEXT NOT NULL);";

    // The version names the backend so switching backends recreates the table.
    return db_.ensure_schema("docs", std::string("1-") + fulltext_backend_name(backend_),
                             ddl, "DROP TABLE IF EXISTS docs;");
}

Status LexicalIndex::replace(const std::string& path, const std::string& content) {
    Transaction tx(db_);
    SIFT_TRY(tx.begin());
    SIFT_TRY(remove(path));

    auto stmt = db_.prepare("INSERT INTO docs (path, content) VALUES (?, ?)");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, content.data(), static_cast<int>(content.size()), SQLITE_TRANSIENT);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database,
            "cannot index " + path + ": " + db_.last_error());
    }
    return tx.commit();
}

Status LexicalIndex::remove(const std::string& path) {
    auto stmt = db_.prepare("DELETE FROM docs WHERE path=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database,
            "cannot drop " + path + " from docs: " + db_.last_error());
    }
    return ok_status();
}

Result<std::vector<LexicalHit>> LexicalIndex::search(const std::string& query, size_t limit) {
    std::vector<std::string> tokens = unique_tokens(query);
    if (tokens.empty() || limit == 0) {
        return Result<std::vector<LexicalHit>>::ok({});
    }
    return backend_ == FulltextBackend::Fts5 ? search_fts(tokens, limit)
                                             : search_substring(tokens, limit);
}

Result<std::vector<LexicalHit>> LexicalIndex::search_fts(
        const std::vector<std::string>& tokens, size_t limit) {
    // Tokens are [a-z0-9_] only, so quoting makes each one a literal term.
    std::string match;
    for (const auto& tok : tokens) {
        if (!match.empty()) match += " OR ";
        match += "\"" + tok + "\"";
    }

    auto stmt = db_.prepare(
        "SELECT path, bm25(docs), snippet(docs, 1, '', '', '...', 24) "
        "FROM docs WHERE docs MATCH ?1 "
        "ORDER BY bm25(docs), path LIMIT ?2");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, match.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(s, 2, static_cast<sqlite3_int64>(limit));

    std::vector<LexicalHit> hits;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        LexicalHit hit;
        hit.path = column_text(s, 0);
        hit.score = -sqlite3_column_double(s, 1);
        hit.snippet = column_text(s, 2);
        hits.push_back(std::move(hit));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database, "fts query failed: " + db_.last_error());
    }
    return Result<std::vector<LexicalHit>>::ok(std::move(hits));
}

Result<std::vector<LexicalHit>> LexicalIndex::search_substring(
        const std::vector<std::string>& tokens, size_t limit) {
    auto stmt = db_.prepare("SELECT path, content FROM docs ORDER BY path");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    std::vector<LexicalHit> hits;
    int rc = SQLITE_DONE;
    while (hits.size() < limit && (rc = sqlite3_step(s)) == SQLITE_ROW) {
        std::string content = column_text(s, 1);
        size_t first = std::string::npos;
        for (const auto& tok : tokens) {
            size_t pos = find_ci(content, tok);
            if (pos < first) first = pos;
        }
        if (first == std::string::npos) continue;

        size_t start = first > kSubstringWindow / 4 ? first - kSubstringWindow / 4 : 0;
        LexicalHit hit;
        hit.path = column_text(s, 0);
        hit.score = 0.0;
        hit.snippet = content.substr(start, kSubstringWindow);
        hits.push_back(std::move(hit));
    }
    if (rc == SQLITE_ROW) rc = SQLITE_DONE;   // stopped at the limit
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database, "docs scan failed: " + db_.last_error());
    }
    return Result<std::vector<LexicalHit>>::ok(std::move(hits));
}

Result<std::optional<std::string>> LexicalIndex::content(const std::string& path) {
    auto stmt = db_.prepare("SELECT content FROM docs WHERE path=? LIMIT 1");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> out;
    int rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) out = column_text(s, 0);
    sqlite3_reset(s);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return SiftError(SiftError::Database, "docs lookup failed: " + db_.last_error());
    }
    return Result<std::optional<std::string>>::ok(std::move(out));
}

Result<size_t> LexicalIndex::size() {
    auto stmt = db_.prepare("SELECT COUNT(*) FROM docs");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    int rc = sqlite3_step(s);
    size_t n = rc == SQLITE_ROW ? static_cast<size_t>(sqlite3_column_int64(s, 0)) : 0;
    sqlite3_reset(s);
    if (rc != SQLITE_ROW) {
        return SiftError(SiftError::Database, "docs count failed: " + db_.last_error());
    }
    return Result<size_t>::ok(n);
}

} // namespace sift
