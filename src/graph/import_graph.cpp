#include <sift/import_graph.hpp>
#include <sift/content_tracker.hpp>
#include <sift/database.hpp>
#include <sift/imports.hpp>
#include <sift/log.hpp>
#include <sqlite3.h>

#include <algorithm>

namespace fs = std::filesystem;

namespace sift {

namespace {

constexpr const char* kEdgeType = "import";

Status open_edges(Database& db) {
    auto r = db.ensure_schema("edges", "1",
        "CREATE TABLE IF NOT EXISTS edges ("
        "  src TEXT NOT NULL,"
        "  dst TEXT NOT NULL,"
        "  type TEXT NOT NULL,"
        "  PRIMARY KEY (src, dst, type)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_edges_dst ON edges(dst);",
        "DROP TABLE IF EXISTS edges;");
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Status delete_edges_from(Database& db, const std::string& src) {
    auto stmt = db.prepare("DELETE FROM edges WHERE src=? AND type=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, src.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, kEdgeType, -1, SQLITE_STATIC);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database, "cannot clear edges of " + src + ": " + db.last_error());
    }
    return ok_status();
}

Status delete_edges_touching(Database& db, const std::string& path) {
    auto stmt = db.prepare("DELETE FROM edges WHERE src=?1 OR dst=?1");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database, "cannot drop edges of " + path + ": " + db.last_error());
    }
    return ok_status();
}

// Replaces the outgoing edges of `src`; returns the number inserted.
Result<size_t> replace_edges(Database& db, const std::string& src,
                             const std::vector<std::string>& targets) {
    SIFT_TRY(delete_edges_from(db, src));
    auto stmt = db.prepare("INSERT OR IGNORE INTO edges (src, dst, type) VALUES (?, ?, ?)");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    size_t added = 0;
    for (const auto& dst : targets) {
        sqlite3_bind_text(s, 1, src.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 2, dst.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 3, kEdgeType, -1, SQLITE_STATIC);
        int rc = sqlite3_step(s);
        sqlite3_reset(s);
        if (rc != SQLITE_DONE) {
            return SiftError(SiftError::Database,
                "cannot insert edge " + src + " -> " + dst + ": " + db.last_error());
        }
        added += static_cast<size_t>(sqlite3_changes(db.handle()));
    }
    return Result<size_t>::ok(added);
}

} // namespace

ImportGraphStore::ImportGraphStore(fs::path root, fs::path db_path, IndexConfig cfg)
    : root_(std::move(root)), db_path_(std::move(db_path)), cfg_(std::move(cfg)) {}

bool ImportGraphStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(db_path_, ec);
}

Result<GraphBuildStats> ImportGraphStore::build(
        const std::optional<std::vector<std::string>>& files) {
    Database db;
    SIFT_TRY(db.open(db_path_.string()));

    ContentTracker tracker(db, root_, cfg_);
    SIFT_TRY(tracker.open());
    SIFT_TRY(open_edges(db));

    auto listed = tracker.list_candidate_files();
    if (listed.is_err()) return std::move(listed).error();
    const std::vector<std::string>& candidates = listed.value();
    ImportResolver resolver(candidates);

    std::vector<std::string> to_scan;
    if (files) {
        for (const auto& f : *files) {
            if (resolver.exists(f)) to_scan.push_back(f);
        }
        std::sort(to_scan.begin(), to_scan.end());
        to_scan.erase(std::unique(to_scan.begin(), to_scan.end()), to_scan.end());
    } else {
        to_scan = candidates;
    }

    GraphBuildStats stats;
    Transaction tx(db);
    SIFT_TRY(tx.begin());

    std::set<std::string> visited;
    auto scan = tracker.scan(to_scan, [&](const ChangedFile& f) -> Status {
        auto added = replace_edges(db, f.path, resolver.resolve(f.path, f.content));
        if (added.is_err()) return std::move(added).error();
        stats.edges_added += added.value();
        visited.insert(f.path);
        return ok_status();
    });
    if (scan.is_err()) return std::move(scan).error();
    stats.updated_files = scan.value().files_indexed;
    for (const auto& path : tracker.dropped()) SIFT_TRY(delete_edges_from(db, path));

    if (!files) {
        auto removed = tracker.prune_missing(candidates);
        if (removed.is_err()) return std::move(removed).error();
        for (const auto& path : removed.value()) {
            SIFT_TRY(delete_edges_touching(db, path));
        }
        stats.files_removed = removed.value().size();
    }

    if (!tracker.added().empty() && visited.size() < candidates.size()) {
        for (const auto& path : candidates) {
            if (visited.count(path)) continue;
            auto content = tracker.read_text(path);
            if (content.is_err()) {
                log::debug("graph: skip %s: %s", path.c_str(), content.error().message.c_str());
                continue;
            }
            auto added = replace_edges(db, path, resolver.resolve(path, content.value()));
            if (added.is_err()) return std::move(added).error();
            stats.edges_added += added.value();
            stats.files_reresolved++;
        }
    }

    SIFT_TRY(tx.commit());
    log::debug("graph: %zu updated, %zu edges added, %zu removed, %zu re-resolved",
               stats.updated_files, stats.edges_added, stats.files_removed,
               stats.files_reresolved);
    return Result<GraphBuildStats>::ok(stats);
}

Result<PathGraph> ImportGraphStore::load() const {
    if (!exists()) {
        return SiftError(SiftError::NotFound, "no import graph at " + db_path_.string());
    }
    Database db;
    SIFT_TRY(db.open(db_path_.string()));
    SIFT_TRY(open_edges(db));

    PathGraph graph;
    auto stmt = db.prepare("SELECT src, dst FROM edges WHERE type=? ORDER BY src, dst");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, kEdgeType, -1, SQLITE_STATIC);
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        graph.add_edge(column_text(s, 0), column_text(s, 1));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Corrupt, "cannot read edges: " + db.last_error());
    }
    return Result<PathGraph>::ok(std::move(graph));
}

Result<PathGraph> ImportGraphStore::build_in_memory() const {
    auto listed = list_candidate_files(root_, cfg_);
    if (listed.is_err()) return std::move(listed).error();
    ImportResolver resolver(listed.value());

    PathGraph graph;
    for (const auto& path : listed.value()) {
        graph.add_node(path);
        auto content = read_source_file(root_, path, cfg_.max_file_bytes);
        if (content.is_err()) {
            log::debug("graph: skip %s: %s", path.c_str(), content.error().message.c_str());
            continue;
        }
        for (const auto& dst : resolver.resolve(path, content.value())) {
            graph.add_edge(path, dst);
        }
    }
    return Result<PathGraph>::ok(std::move(graph));
}

Result<std::set<std::string>> ImportGraphStore::impacted(
        const std::vector<std::string>& changed, size_t depth) const {
    auto graph = exists() ? load() : build_in_memory();
    if (graph.is_err() && graph.error().is_cache_miss()) {
        log::warn("import graph unusable (%s), rebuilding in memory",
                  graph.error().message.c_str());
        graph = build_in_memory();
    }
    if (graph.is_err()) return std::move(graph).error();
    return Result<std::set<std::string>>::ok(graph.value().impacted(changed, depth));
}

} // namespace sift
