#pragma once

#include <sift/result.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sift {

struct IndexConfig {
    uint64_t max_file_bytes = 1024 * 1024;
    std::vector<std::string> exclude_dirs;
    std::vector<std::string> extensions;     // with leading dot, lowercase
    std::string fulltext = "auto";           // auto | fts5 | substring

    IndexConfig();
};

struct ChunkConfig {
    size_t size = 900;
    size_t overlap = 120;
    size_t min_chars = 80;
};

struct DenseConfig {
    bool enabled = true;
    std::string provider = "stub_hash";
    std::string model = "hash-256";
    int dim = 256;
    std::string backend = "scan";            // scan | hnsw
};

struct SearchConfig {
    std::string mode = "hybrid";        // fts, vector or hybrid
    int limit = 10;
    int context_lines = 9;
    int candidate_multiplier = 4;
};

struct TestsConfig {
    int max_tests = 20;
    int impact_depth = 6;
    int fallback_count = 5;
};

struct LogConfig {
    std::string level;                       // empty: leave the logger alone
};

// Layered configuration: global (~/.sift/config.toml) then repository
// (<repo>/.sift/config.toml). A later layer overrides only the keys it sets.
struct Config {
    IndexConfig index;
    ChunkConfig chunk;
    DenseConfig dense;
    SearchConfig search;
    TestsConfig tests;
    LogConfig log;

    // Dotted keys ("dense.dim") present in the parsed TOML.
    std::set<std::string> explicit_keys;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& repo);

    // Rejects values no component can work with (zero chunk size,
    // overlap >= size, non-positive dim, unknown fulltext mode).
    Status validate() const;
};

// ~/.sift/config.toml, or "" when no home directory is known.
std::string global_config_path();

// Loads the global and repository layers that exist, merges and validates.
// A missing file is not an error; an unreadable or invalid one is.
Result<Config> load_config(const std::filesystem::path& repo_root);

} // namespace sift
