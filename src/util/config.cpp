#include <sift/config.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace sift {

IndexConfig::IndexConfig()
    : exclude_dirs{".git", ".hg", ".svn", "node_modules", "__pycache__",
                   ".venv", "venv", "build", "dist", "target", "out",
                   ".mypy_cache", ".pytest_cache", ".tox", ".idea",
                   ".vscode", ".sift"},
      extensions{".py", ".pyi", ".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx",
                 ".go", ".rs", ".java", ".kt", ".kts", ".scala", ".rb",
                 ".php", ".cs", ".swift", ".c", ".h", ".cc", ".cpp", ".cxx",
                 ".hh", ".hpp", ".hxx", ".m", ".mm", ".lua", ".sh", ".bash",
                 ".zsh", ".sql", ".proto", ".md", ".rst", ".txt", ".json",
                 ".yaml", ".yml", ".toml", ".ini", ".cfg", ".xml", ".html",
                 ".css", ".scss", ".vue", ".svelte", ".cmake", ".gradle"} {}

namespace {

SiftError type_error(const std::string& key, const char* expected) {
    return SiftError(SiftError::Config,
        "config key '" + key + "' must be " + expected);
}

// Each reader leaves `out` untouched when the key is absent and records the
// key in `seen` when it is present and well-typed.
Status read_int(const toml::table& tbl, const std::string& section,
                const char* name, int64_t& out, std::set<std::string>& seen) {
    const toml::node* node = tbl.get(name);
    if (!node) return ok_status();
    std::string key = section + "." + name;
    auto v = node->value<int64_t>();
    if (!v || !node->is_integer()) return type_error(key, "an integer");
    out = *v;
    seen.insert(key);
    return ok_status();
}

Status read_bool(const toml::table& tbl, const std::string& section,
                 const char* name, bool& out, std::set<std::string>& seen) {
    const toml::node* node = tbl.get(name);
    if (!node) return ok_status();
    std::string key = section + "." + name;
    if (!node->is_boolean()) return type_error(key, "a boolean");
    out = *node->value<bool>();
    seen.insert(key);
    return ok_status();
}

Status read_string(const toml::table& tbl, const std::string& section,
                   const char* name, std::string& out, std::set<std::string>& seen) {
    const toml::node* node = tbl.get(name);
    if (!node) return ok_status();
    std::string key = section + "." + name;
    if (!node->is_string()) return type_error(key, "a string");
    out = *node->value<std::string>();
    seen.insert(key);
    return ok_status();
}

Status read_string_list(const toml::table& tbl, const std::string& section,
                        const char* name, std::vector<std::string>& out,
                        std::set<std::string>& seen) {
    const toml::node* node = tbl.get(name);
    if (!node) return ok_status();
    std::string key = section + "." + name;
    const toml::array* arr = node->as_array();
    if (!arr) return type_error(key, "an array of strings");
    std::vector<std::string> items;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s || !elem.is_string()) return type_error(key, "an array of strings");
        items.push_back(*s);
    }
    out = std::move(items);
    seen.insert(key);
    return ok_status();
}

template<typename T>
Status read_count(const toml::table& tbl, const std::string& section,
                  const char* name, T& out, std::set<std::string>& seen) {
    int64_t v = static_cast<int64_t>(out);
    SIFT_TRY(read_int(tbl, section, name, v, seen));
    if (v < 0) {
        return type_error(section + "." + name, "a non-negative integer");
    }
    out = static_cast<T>(v);
    return ok_status();
}

std::string normalize_extension(std::string ext) {
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    if (!ext.empty() && ext[0] != '.') ext.insert(ext.begin(), '.');
    return ext;
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SiftError(SiftError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line));
    }

    Config cfg;
    auto& seen = cfg.explicit_keys;

    if (auto tbl = doc["index"].as_table()) {
        SIFT_TRY(read_count(*tbl, "index", "max_file_bytes", cfg.index.max_file_bytes, seen));
        SIFT_TRY(read_string_list(*tbl, "index", "exclude_dirs", cfg.index.exclude_dirs, seen));
        SIFT_TRY(read_string_list(*tbl, "index", "extensions", cfg.index.extensions, seen));
        SIFT_TRY(read_string(*tbl, "index", "fulltext", cfg.index.fulltext, seen));
        for (auto& ext : cfg.index.extensions) ext = normalize_extension(ext);
    }

    if (auto tbl = doc["chunk"].as_table()) {
        SIFT_TRY(read_count(*tbl, "chunk", "size", cfg.chunk.size, seen));
        SIFT_TRY(read_count(*tbl, "chunk", "overlap", cfg.chunk.overlap, seen));
        SIFT_TRY(read_count(*tbl, "chunk", "min_chars", cfg.chunk.min_chars, seen));
    }

    if (auto tbl = doc["dense"].as_table()) {
        SIFT_TRY(read_bool(*tbl, "dense", "enabled", cfg.dense.enabled, seen));
        SIFT_TRY(read_string(*tbl, "dense", "provider", cfg.dense.provider, seen));
        SIFT_TRY(read_string(*tbl, "dense", "model", cfg.dense.model, seen));
        SIFT_TRY(read_count(*tbl, "dense", "dim", cfg.dense.dim, seen));
        SIFT_TRY(read_string(*tbl, "dense", "backend", cfg.dense.backend, seen));
    }

    if (auto tbl = doc["search"].as_table()) {
        SIFT_TRY(read_string(*tbl, "search", "mode", cfg.search.mode, seen));
        SIFT_TRY(read_count(*tbl, "search", "limit", cfg.search.limit, seen));
        SIFT_TRY(read_count(*tbl, "search", "context_lines", cfg.search.context_lines, seen));
        SIFT_TRY(read_count(*tbl, "search", "candidate_multiplier",
                            cfg.search.candidate_multiplier, seen));
    }

    if (auto tbl = doc["tests"].as_table()) {
        SIFT_TRY(read_count(*tbl, "tests", "max_tests", cfg.tests.max_tests, seen));
        SIFT_TRY(read_count(*tbl, "tests", "impact_depth", cfg.tests.impact_depth, seen));
        SIFT_TRY(read_count(*tbl, "tests", "fallback_count", cfg.tests.fallback_count, seen));
    }

    if (auto tbl = doc["log"].as_table()) {
        SIFT_TRY(read_string(*tbl, "log", "level", cfg.log.level, seen));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SiftError(SiftError::IO, "cannot open config file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        SiftError e = std::move(r).error();
        e.file = path;
        return e;
    }
    return r;
}

void Config::merge(const Config& other) {
    auto has = [&](const char* key) { return other.explicit_keys.count(key) > 0; };

    if (has("index.max_file_bytes")) index.max_file_bytes = other.index.max_file_bytes;
    if (has("index.exclude_dirs")) index.exclude_dirs = other.index.exclude_dirs;
    if (has("index.extensions")) index.extensions = other.index.extensions;
    if (has("index.fulltext")) index.fulltext = other.index.fulltext;

    if (has("chunk.size")) chunk.size = other.chunk.size;
    if (has("chunk.overlap")) chunk.overlap = other.chunk.overlap;
    if (has("chunk.min_chars")) chunk.min_chars = other.chunk.min_chars;

    if (has("dense.enabled")) dense.enabled = other.dense.enabled;
    if (has("dense.provider")) dense.provider = other.dense.provider;
    if (has("dense.model")) dense.model = other.dense.model;
    if (has("dense.dim")) dense.dim = other.dense.dim;
    if (has("dense.backend")) dense.backend = other.dense.backend;

    if (has("search.mode")) search.mode = other.search.mode;
    if (has("search.limit")) search.limit = other.search.limit;
    if (has("search.context_lines")) search.context_lines = other.search.context_lines;
    if (has("search.candidate_multiplier"))
        search.candidate_multiplier = other.search.candidate_multiplier;

    if (has("tests.max_tests")) tests.max_tests = other.tests.max_tests;
    if (has("tests.impact_depth")) tests.impact_depth = other.tests.impact_depth;
    if (has("tests.fallback_count")) tests.fallback_count = other.tests.fallback_count;

    if (has("log.level")) log.level = other.log.level;

    explicit_keys.insert(other.explicit_keys.begin(), other.explicit_keys.end());
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& repo) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (repo.has_value()) result.merge(repo.value());
    return result;
}

Status Config::validate() const {
    if (chunk.size == 0) {
        return SiftError(SiftError::Config, "chunk.size must be positive");
    }
    if (chunk.overlap >= chunk.size) {
        return SiftError(SiftError::Config, "chunk.overlap must be smaller than chunk.size");
    }
    if (dense.dim <= 0) {
        return SiftError(SiftError::Config, "dense.dim must be positive");
    }
    if (index.fulltext != "auto" && index.fulltext != "fts5" &&
        index.fulltext != "substring") {
        return SiftError(SiftError::Config,
            "index.fulltext must be one of auto, fts5, substring",
            "got '" + index.fulltext + "'");
    }
    if (search.mode != "fts" && search.mode != "vector" && search.mode != "hybrid") {
        return SiftError(SiftError::Config,
            "search.mode must be one of fts, vector, hybrid",
            "got '" + search.mode + "'");
    }
    if (search.limit <= 0) {
        return SiftError(SiftError::Config, "search.limit must be positive");
    }
    return ok_status();
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.sift/config.toml";
}

Result<Config> load_config(const fs::path& repo_root) {
    std::optional<Config> global;
    std::optional<Config> repo;

    std::string gpath = global_config_path();
    std::error_code ec;
    if (!gpath.empty() && fs::is_regular_file(gpath, ec)) {
        auto r = Config::load(gpath);
        if (r.is_err()) return std::move(r).error();
        global = std::move(r).value();
    }

    fs::path rpath = repo_root / ".sift" / "config.toml";
    if (fs::is_regular_file(rpath, ec)) {
        auto r = Config::load(rpath.string());
        if (r.is_err()) return std::move(r).error();
        repo = std::move(r).value();
    }

    Config cfg = Config::effective(global, repo);
    SIFT_TRY(cfg.validate());
    return Result<Config>::ok(std::move(cfg));
}

} // namespace sift
