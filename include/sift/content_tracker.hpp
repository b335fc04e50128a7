#pragma once

#include <sift/config.hpp>
#include <sift/database.hpp>
#include <sift/result.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sift {

struct FileRecord {
    std::string path;           // repo-relative, '/' separated
    std::string content_hash;
    double mtime = 0.0;
    int64_t size = 0;
};

struct ScanStats {
    size_t files_seen = 0;
    size_t files_indexed = 0;
    size_t files_unchanged = 0;
    size_t files_skipped = 0;
    size_t files_removed = 0;
};

// A file whose content hash differs from the stored record.
struct ChangedFile {
    std::string path;
    std::string content;
    std::string content_hash;
};

bool is_excluded_dir(const IndexConfig& cfg, const std::string& name);
bool has_text_extension(const IndexConfig& cfg, const std::string& rel_path);

// Repo-relative paths of text-like files under `root` outside excluded
// directories, sorted. Symlinks are not followed.
Result<std::vector<std::string>> list_candidate_files(const std::filesystem::path& root,
                                                      const IndexConfig& cfg);

// Reads a text file under `root`. Unavailable when it is larger than
// `max_bytes` or has a NUL byte in its first kBinarySniffBytes.
Result<std::string> read_source_file(const std::filesystem::path& root,
                                     const std::string& rel_path, uint64_t max_bytes);

using ChangeVisitor = std::function<Status(const ChangedFile&)>;

// Tracks per-file content hashes in the `files` table of `db` so that
// unchanged files are skipped on the next scan.
class ContentTracker {
public:
    ContentTracker(Database& db, std::filesystem::path root, IndexConfig cfg);

    Status open();

    // Forgets every record so the next scan treats all files as changed.
    Status clear();

    Result<std::vector<std::string>> list_candidate_files() const;

    // For each candidate: equal (mtime, size) skips without hashing; an equal
    // hash refreshes the record; otherwise the visitor runs and then the record
    // is replaced. A visitor error aborts the scan with that error. A recorded
    // file that turned binary or oversized loses its record (see dropped()).
    Result<ScanStats> scan(const std::vector<std::string>& candidates,
                           const ChangeVisitor& visitor);

    // Deletes records whose path is not among `candidates` and returns them.
    Result<std::vector<std::string>> prune_missing(const std::vector<std::string>& candidates);

    Result<std::optional<FileRecord>> get(const std::string& path);
    Result<std::vector<FileRecord>> all();

    // Paths first recorded by the last scan().
    const std::vector<std::string>& added() const { return added_; }

    // Recorded paths the last scan() could no longer read as text. Callers
    // treat them like deleted files.
    const std::vector<std::string>& dropped() const { return dropped_; }

    // Reads a tracked-size text file; Unavailable for binary or oversized.
    Result<std::string> read_text(const std::string& rel_path) const;

    const std::filesystem::path& root() const { return root_; }

private:
    Status upsert(const FileRecord& rec);
    Status remove(const std::string& path);

    Database& db_;
    std::filesystem::path root_;
    IndexConfig cfg_;
    std::vector<std::string> added_;
    std::vector<std::string> dropped_;
};

} // namespace sift
