#pragma once

#include <sift/config.hpp>
#include <sift/content_tracker.hpp>
#include <sift/dense_index.hpp>
#include <sift/import_graph.hpp>
#include <sift/result.hpp>
#include <sift/retrieval.hpp>
#include <sift/test_selector.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sift {

// Locations of every persisted artifact of one repository.
struct StorePaths {
    std::filesystem::path root;
    std::filesystem::path state_dir;    // <root>/.sift
    std::filesystem::path index_db;     // index/index.db
    std::filesystem::path index_stats;  // index/index_stats.json
    std::filesystem::path dense_index;  // kb/dense_index.json
    std::filesystem::path ann_index;    // kb/ann_index.bin (+ .meta.json)
    std::filesystem::path graph_db;     // graph/graph.db
    std::filesystem::path config_file;  // config.toml

    static StorePaths for_root(const std::filesystem::path& root);
};

struct BuildReport {
    ScanStats scan;
    std::string fulltext_backend;
    bool dense_enabled = false;
    bool dense_full_rebuild = false;
    DenseUpdateStats dense;
    size_t dense_vectors = 0;
    std::string ann_backend;
    bool ann_rebuilt = false;
    GraphBuildStats graph;
    std::vector<std::string> degraded;  // components skipped with a warning
};

// Writes `report` as JSON through a temporary file renamed over `path`.
Status save_build_report(const BuildReport& report, const std::filesystem::path& path);

// One repository. Every call opens the stores it needs and closes them
// before returning.
class Engine {
public:
    Engine(std::filesystem::path root, Config cfg);

    // Loads layered configuration for `root` and applies its log level.
    static Result<Engine> open(const std::filesystem::path& root);

    Result<BuildReport> build();

    // `mode` overrides search.mode from the configuration.
    Result<SearchResponse> search(const std::string& query,
                                  std::optional<size_t> limit = std::nullopt,
                                  std::optional<int> context_lines = std::nullopt,
                                  std::optional<SearchMode> mode = std::nullopt);

    Result<TestSelection> select_tests(const std::vector<std::string>& changed,
                                       std::optional<size_t> max_tests = std::nullopt);

    // Sorted reverse-reachable set, seeds included.
    Result<std::vector<std::string>> impacted_files(const std::vector<std::string>& changed,
                                                    std::optional<size_t> depth = std::nullopt);

    // Forward import tree of one file, for display.
    Result<std::string> dependency_tree(const std::string& path);

    // Repo-relative '/' form of a user-supplied path (absolute or "./x").
    std::string relative_path(const std::string& path) const;

    const Config& config() const { return cfg_; }
    const StorePaths& paths() const { return paths_; }

private:
    ImportGraphStore graph_store() const;

    std::filesystem::path root_;
    Config cfg_;
    StorePaths paths_;
};

// Query surface over a repository root with its layered configuration.
Result<BuildReport> build(const std::filesystem::path& repo_root);

Result<SearchResponse> search(const std::filesystem::path& repo_root, const std::string& query,
                              size_t limit = 10, int context_lines = 9,
                              SearchMode mode = SearchMode::Hybrid);

Result<TestSelection> select_tests(const std::filesystem::path& repo_root,
                                   const std::vector<std::string>& changed_files,
                                   size_t max_tests = 20);

Result<std::vector<std::string>> impacted_files(const std::filesystem::path& repo_root,
                                                const std::vector<std::string>& changed_files,
                                                size_t depth = 6);

} // namespace sift
