#include <sift/content_tracker.hpp>
#include <sift/log.hpp>
#include <sift/sha256.hpp>
#include <sift/text.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace sift {

namespace {

constexpr const char* kTrackerSchemaVersion = "1";

double mtime_seconds(fs::file_time_type t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

std::string lower_extension(const std::string& rel_path) {
    std::string ext = fs::path(rel_path).extension().string();
    return to_lower(ext);
}

} // namespace

ContentTracker::ContentTracker(Database& db, fs::path root, IndexConfig cfg)
    : db_(db), root_(std::move(root)), cfg_(std::move(cfg)) {}

Status ContentTracker::open() {
    auto r = db_.ensure_schema("files", kTrackerSchemaVersion,
        "CREATE TABLE IF NOT EXISTS files ("
        "  path TEXT PRIMARY KEY,"
        "  content_hash TEXT NOT NULL,"
        "  mtime REAL NOT NULL,"
        "  size INTEGER NOT NULL"
        ");",
        "DROP TABLE IF EXISTS files;");
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

Status ContentTracker::clear() {
    return db_.exec("DELETE FROM files;");
}

bool is_excluded_dir(const IndexConfig& cfg, const std::string& name) {
    return std::find(cfg.exclude_dirs.begin(), cfg.exclude_dirs.end(), name)
        != cfg.exclude_dirs.end();
}

bool has_text_extension(const IndexConfig& cfg, const std::string& rel_path) {
    std::string ext = lower_extension(rel_path);
    if (ext.empty()) return false;
    return std::find(cfg.extensions.begin(), cfg.extensions.end(), ext)
        != cfg.extensions.end();
}

Result<std::vector<std::string>> list_candidate_files(const fs::path& root,
                                                      const IndexConfig& cfg) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return SiftError(SiftError::NotFound,
            "repository root is not a directory: " + root.string());
    }

    fs::recursive_directory_iterator it(root,
        fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return SiftError(SiftError::IO,
            "cannot walk " + root.string(), ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log::debug("walk error under %s: %s", root.string().c_str(),
                       ec.message().c_str());
            ec.clear();
            continue;
        }
        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();

        if (entry.is_symlink(ec)) {
            if (entry.is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (entry.is_directory(ec)) {
            if (is_excluded_dir(cfg, name)) it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;

        std::string rel = entry.path().lexically_relative(root).generic_string();
        if (!has_text_extension(cfg, rel)) continue;
        out.push_back(std::move(rel));
    }

    std::sort(out.begin(), out.end());
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<std::vector<std::string>> ContentTracker::list_candidate_files() const {
    return sift::list_candidate_files(root_, cfg_);
}

Result<std::string> read_source_file(const fs::path& root, const std::string& rel_path,
                                     uint64_t max_bytes) {
    fs::path abs = root / rel_path;
    std::error_code ec;
    auto size = fs::file_size(abs, ec);
    if (ec) {
        return SiftError(SiftError::IO, "cannot stat " + rel_path, ec.message());
    }
    if (size > max_bytes) {
        return SiftError(SiftError::Unavailable,
            rel_path + " exceeds the size ceiling");
    }

    std::ifstream in(abs, std::ios::binary);
    if (!in.is_open()) {
        return SiftError(SiftError::IO, "cannot read " + rel_path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return SiftError(SiftError::IO, "read failed for " + rel_path);
    }
    std::string content = ss.str();
    if (looks_binary(content)) {
        return SiftError(SiftError::Unavailable, rel_path + " looks binary");
    }
    return Result<std::string>::ok(std::move(content));
}

Result<std::string> ContentTracker::read_text(const std::string& rel_path) const {
    return read_source_file(root_, rel_path, cfg_.max_file_bytes);
}

Result<ScanStats> ContentTracker::scan(const std::vector<std::string>& candidates,
                                       const ChangeVisitor& visitor) {
    ScanStats stats;
    stats.files_seen = candidates.size();
    added_.clear();
    dropped_.clear();

    for (const auto& rel : candidates) {
        fs::path abs = root_ / rel;
        std::error_code ec;
        auto ftime = fs::last_write_time(abs, ec);
        if (ec) {
            log::debug("skip %s: %s", rel.c_str(), ec.message().c_str());
            stats.files_skipped++;
            continue;
        }
        auto fsize = fs::file_size(abs, ec);
        if (ec) {
            log::debug("skip %s: %s", rel.c_str(), ec.message().c_str());
            stats.files_skipped++;
            continue;
        }

        FileRecord rec;
        rec.path = rel;
        rec.mtime = mtime_seconds(ftime);
        rec.size = static_cast<int64_t>(fsize);

        auto prev = get(rel);
        if (prev.is_err()) return std::move(prev).error();
        const auto& stored = prev.value();

        if (stored && stored->mtime == rec.mtime && stored->size == rec.size) {
            stats.files_unchanged++;
            continue;
        }

        auto content = read_text(rel);
        if (content.is_err()) {
            log::debug("skip %s: %s", rel.c_str(), content.error().message.c_str());
            stats.files_skipped++;
            if (stored && content.error().code == SiftError::Unavailable) {
                SIFT_TRY(remove(rel));
                dropped_.push_back(rel);
            }
            continue;
        }

        rec.content_hash = sha256_hex(content.value());
        if (stored && stored->content_hash == rec.content_hash) {
            SIFT_TRY(upsert(rec));
            stats.files_unchanged++;
            continue;
        }

        ChangedFile changed{rel, std::move(content).value(), rec.content_hash};
        SIFT_TRY(visitor(changed));
        SIFT_TRY(upsert(rec));
        if (!stored) added_.push_back(rel);
        stats.files_indexed++;
    }

    return Result<ScanStats>::ok(stats);
}

Result<std::vector<std::string>> ContentTracker::prune_missing(
        const std::vector<std::string>& candidates) {
    std::set<std::string> live(candidates.begin(), candidates.end());
    auto records = all();
    if (records.is_err()) return std::move(records).error();

    std::vector<std::string> removed;
    for (const auto& rec : records.value()) {
        if (live.count(rec.path)) continue;
        SIFT_TRY(remove(rec.path));
        removed.push_back(rec.path);
    }
    return Result<std::vector<std::string>>::ok(std::move(removed));
}

Result<std::optional<FileRecord>> ContentTracker::get(const std::string& path) {
    auto stmt = db_.prepare(
        "SELECT content_hash, mtime, size FROM files WHERE path=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<FileRecord> out;
    int rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        FileRecord rec;
        rec.path = path;
        rec.content_hash = column_text(s, 0);
        rec.mtime = sqlite3_column_double(s, 1);
        rec.size = sqlite3_column_int64(s, 2);
        out = std::move(rec);
    } else if (rc != SQLITE_DONE) {
        std::string msg = db_.last_error();
        sqlite3_reset(s);
        return SiftError(SiftError::Database, "file record lookup failed: " + msg);
    }
    sqlite3_reset(s);
    return Result<std::optional<FileRecord>>::ok(std::move(out));
}

Result<std::vector<FileRecord>> ContentTracker::all() {
    auto stmt = db_.prepare(
        "SELECT path, content_hash, mtime, size FROM files ORDER BY path");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();

    std::vector<FileRecord> out;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        FileRecord rec;
        rec.path = column_text(s, 0);
        rec.content_hash = column_text(s, 1);
        rec.mtime = sqlite3_column_double(s, 2);
        rec.size = sqlite3_column_int64(s, 3);
        out.push_back(std::move(rec));
    }
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database, "file record scan failed: " + db_.last_error());
    }
    return Result<std::vector<FileRecord>>::ok(std::move(out));
}

Status ContentTracker::upsert(const FileRecord& rec) {
    auto stmt = db_.prepare(
        "INSERT OR REPLACE INTO files (path, content_hash, mtime, size) "
        "VALUES (?, ?, ?, ?)");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, rec.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, rec.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(s, 3, rec.mtime);
    sqlite3_bind_int64(s, 4, rec.size);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database,
            "cannot store file record for " + rec.path + ": " + db_.last_error());
    }
    return ok_status();
}

Status ContentTracker::remove(const std::string& path) {
    auto stmt = db_.prepare("DELETE FROM files WHERE path=?");
    if (stmt.is_err()) return std::move(stmt).error();
    sqlite3_stmt* s = stmt.value();
    sqlite3_bind_text(s, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(s);
    sqlite3_reset(s);
    if (rc != SQLITE_DONE) {
        return SiftError(SiftError::Database,
            "cannot delete file record for " + path + ": " + db_.last_error());
    }
    return ok_status();
}

} // namespace sift
