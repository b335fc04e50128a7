#pragma once

#include <sift/config.hpp>
#include <sift/graph.hpp>
#include <sift/result.hpp>

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sift {

struct GraphBuildStats {
    size_t updated_files = 0;   // files whose content hash changed
    size_t edges_added = 0;     // edge rows inserted by this build
    size_t files_removed = 0;
    size_t files_reresolved = 0;
};

// Persisted import graph in graph.db: a `files` table owned by a
// ContentTracker and `edges(src, dst, type)`. Edges of a source file are
// always replaced as a whole.
class ImportGraphStore {
public:
    ImportGraphStore(std::filesystem::path root, std::filesystem::path db_path,
                     IndexConfig cfg);

    bool exists() const;

    // Rebuilds edges of changed files. With `files`, only those paths are
    // re-hashed and nothing is pruned; imports still resolve against every
    // candidate file. When files appear, unchanged files are re-resolved too
    // so imports that were dangling can land on them.
    Result<GraphBuildStats> build(const std::optional<std::vector<std::string>>& files = std::nullopt);

    // Graph as persisted; NotFound when graph.db does not exist.
    Result<PathGraph> load() const;

    // Extracts the whole graph from the tree without touching graph.db.
    Result<PathGraph> build_in_memory() const;

    // Reverse BFS from `changed`, up to `depth` hops, seeds included. Uses the
    // persisted graph when present, otherwise an in-memory one.
    Result<std::set<std::string>> impacted(const std::vector<std::string>& changed,
                                           size_t depth) const;


private:
    std::filesystem::path root_;
    std::filesystem::path db_path_;
    IndexConfig cfg_;
};

} // namespace sift
