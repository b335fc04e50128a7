#pragma once

#include <sift/database.hpp>
#include <sift/result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sift {

enum class FulltextBackend { Fts5, Substring };

const char* fulltext_backend_name(FulltextBackend b);

struct LexicalHit {
    std::string path;
    double score = 0.0;         // higher is better; always 0 for Substring
    std::string snippet;
};

// Keyword index over whole-file contents in the `docs` table. With FTS5 the
// table is a virtual table ranked by bm25; otherwise a plain table scanned
// in path order.
class LexicalIndex {
public:
    // Characters kept around the first match by the substring backend.
    static constexpr size_t kSubstringWindow = 160;

    // mode: "auto" tests for FTS5, "fts5" requires it, "substring" never uses it.
    LexicalIndex(Database& db, std::string mode);

    // Creates the docs table. Returns true when an existing table built for a
    // different backend was dropped, so every file must be re-indexed.
    Result<bool> open();

    FulltextBackend backend() const { return backend_; }

    // Replaces the row for `path` (delete then insert) atomically.
    Status replace(const std::string& path, const std::string& content);
    Status remove(const std::string& path);

    Result<std::vector<LexicalHit>> search(const std::string& query, size_t limit);

    Result<std::optional<std::string>> content(const std::string& path);
    Result<size_t> size();

    // True when this SQLite build accepts fts5 virtual tables.
    static bool fts5_available(Database& db);

private:
    Result<std::vector<LexicalHit>> search_fts(const std::vector<std::string>& tokens,
                                               size_t limit);
    Result<std::vector<LexicalHit>> search_substring(const std::vector<std::string>& tokens,
                                                     size_t limit);

    Database& db_;
    std::string mode_;
    FulltextBackend backend_ = FulltextBackend::Substring;
};

} // namespace sift
