#include <sift/engine.hpp>
#include <sift/ann.hpp>
#include <sift/chunker.hpp>
#include <sift/database.hpp>
#include <sift/embedding.hpp>
#include <sift/lexical_index.hpp>
#include <sift/log.hpp>
#include <sift/symbol_index.hpp>
#include <sift/text.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <memory>
#include <set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sift {

StorePaths StorePaths::for_root(const fs::path& root) {
    StorePaths p;
    p.root = root;
    p.state_dir = root / ".sift";
    p.index_db = p.state_dir / "index" / "index.db";
    p.index_stats = p.state_dir / "index" / "index_stats.json";
    p.dense_index = p.state_dir / "kb" / "dense_index.json";
    p.ann_index = p.state_dir / "kb" / "ann_index.bin";
    p.graph_db = p.state_dir / "graph" / "graph.db";
    p.config_file = p.state_dir / "config.toml";
    return p;
}

namespace {

// Opened index.db stores. A docs or symbols table recreated for a new
// backend or schema forgets the tracker so every file is indexed again.
struct IndexStores {
    Database db;
    std::unique_ptr<ContentTracker> tracker;
    std::unique_ptr<LexicalIndex> lexical;
    std::unique_ptr<SymbolIndex> symbols;
};

Status open_index(IndexStores& s, const StorePaths& paths, const Config& cfg) {
    SIFT_TRY(s.db.open(paths.index_db.string()).context("index store"));
    s.tracker = std::make_unique<ContentTracker>(s.db, paths.root, cfg.index);
    s.lexical = std::make_unique<LexicalIndex>(s.db, cfg.index.fulltext);
    s.symbols = std::make_unique<SymbolIndex>(s.db);

    SIFT_TRY(s.tracker->open());
    SIFT_TRY_ASSIGN(bool docs_reset, s.lexical->open());
    SIFT_TRY_ASSIGN(bool symbols_reset, s.symbols->open());

    if (docs_reset || symbols_reset) {
        log::info("index layout changed, every file will be re-indexed");
        SIFT_TRY(s.tracker->clear());
    }
    return ok_status();
}

// Chunks every tracked-size text file for a full dense rebuild.
std::map<std::string, std::string> chunk_all(const StorePaths& paths, const Config& cfg,
                                             const std::vector<std::string>& files) {
    std::map<std::string, std::string> chunks;
    for (const auto& path : files) {
        auto content = read_source_file(paths.root, path, cfg.index.max_file_bytes);
        if (content.is_err()) {
            log::debug("chunk: skip %s: %s", path.c_str(), content.error().message.c_str());
            continue;
        }
        for (auto& c : chunk_text(path, content.value(), cfg.chunk)) {
            chunks.emplace(std::move(c.chunk_id), std::move(c.content));
        }
    }
    return chunks;
}

void remove_file(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) log::debug("cannot remove %s: %s", p.string().c_str(), ec.message().c_str());
}

} // namespace

Status save_build_report(const BuildReport& r, const fs::path& path) {
    json doc = {
        {"files", {
            {"seen", r.scan.files_seen},
            {"indexed", r.scan.files_indexed},
            {"unchanged", r.scan.files_unchanged},
            {"skipped", r.scan.files_skipped},
            {"removed", r.scan.files_removed},
        }},
        {"fulltext_backend", r.fulltext_backend},
        {"dense", {
            {"enabled", r.dense_enabled},
            {"full_rebuild", r.dense_full_rebuild},
            {"embedded", r.dense.embedded},
            {"reused", r.dense.reused},
            {"pruned", r.dense.pruned},
            {"vectors", r.dense_vectors},
        }},
        {"ann", {{"backend", r.ann_backend}, {"rebuilt", r.ann_rebuilt}}},
        {"graph", {
            {"updated_files", r.graph.updated_files},
            {"edges_added", r.graph.edges_added},
            {"files_removed", r.graph.files_removed},
            {"files_reresolved", r.graph.files_reresolved},
        }},
        {"degraded", r.degraded},
    };

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return SiftError(SiftError::IO, "cannot write " + tmp.string());
        }
        out << doc.dump(2) << "\n";
        if (!out.good()) {
            return SiftError(SiftError::IO, "write failed for " + tmp.string());
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        return SiftError(SiftError::IO, "cannot replace " + path.string(), ec.message());
    }
    return ok_status();
}

Engine::Engine(fs::path root, Config cfg)
    : root_(std::move(root)), cfg_(std::move(cfg)), paths_(StorePaths::for_root(root_)) {}

Result<Engine> Engine::open(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return SiftError(SiftError::NotFound, "not a directory: " + root.string());
    }
    fs::path abs = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec) abs = root;

    SIFT_TRY_ASSIGN(Config cfg, load_config(abs));

    if (!cfg.log.level.empty()) {
        log::Level lvl;
        if (log::parse_level(cfg.log.level, lvl)) {
            log::set_level(lvl);
        } else {
            log::warn("ignoring unknown log level '%s'", cfg.log.level.c_str());
        }
    }
    return Result<Engine>::ok(Engine(abs, std::move(cfg)));
}

ImportGraphStore Engine::graph_store() const {
    return ImportGraphStore(root_, paths_.graph_db, cfg_.index);
}

std::string Engine::relative_path(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute()) {
        fs::path rel = p.lexically_normal().lexically_relative(root_);
        if (!rel.empty() && rel.generic_string().rfind("..", 0) != 0) p = rel;
    }
    return p.lexically_normal().generic_string();
}

Result<BuildReport> Engine::build() {
    BuildReport report;

    IndexStores stores;
    SIFT_TRY(open_index(stores, paths_, cfg_));
    report.fulltext_backend = fulltext_backend_name(stores.lexical->backend());

    // Dense side: an unusable adapter disables it; an unusable index file is
    // rebuilt from every tracked file.
    std::unique_ptr<EmbeddingAdapter> adapter;
    std::optional<DenseIndex> dense;
    if (cfg_.dense.enabled) {
        auto made = make_embedding_adapter(cfg_.dense);
        if (made.is_err()) {
            log::warn("dense index disabled: %s", made.error().message.c_str());
            report.degraded.push_back(kSourceVector);
        } else {
            adapter = std::move(made).value();
            auto loaded = DenseIndex::load(paths_.dense_index, *adapter, cfg_.dense.backend);
            if (loaded.is_ok()) {
                dense = std::move(loaded).value();
            } else {
                if (!loaded.error().is_cache_miss()) {
                    log::warn("dense index unreadable (%s), rebuilding",
                              loaded.error().message.c_str());
                } else if (loaded.error().code != SiftError::NotFound) {
                    log::info("dense index %s, rebuilding", loaded.error().message.c_str());
                }
                dense.emplace(adapter->provider(), adapter->model(), adapter->dim(),
                              cfg_.dense.backend);
                report.dense_full_rebuild = true;
            }
        }
    }
    report.dense_enabled = dense.has_value();

    auto listed = stores.tracker->list_candidate_files();
    if (listed.is_err()) return std::move(listed).error();
    const std::vector<std::string>& candidates = listed.value();

    std::vector<Chunk> pending_chunks;
    std::set<std::string> touched;
    bool chunk_changed = dense && !report.dense_full_rebuild;

    Transaction tx(stores.db);
    SIFT_TRY(tx.begin());

    auto scan = stores.tracker->scan(candidates, [&](const ChangedFile& f) -> Status {
        SIFT_TRY(stores.lexical->replace(f.path, f.content));
        SIFT_TRY(stores.symbols->replace(f.path, extract_symbols(f.path, f.content)));
        if (chunk_changed) {
            touched.insert(f.path);
            for (auto& c : chunk_text(f.path, f.content, cfg_.chunk)) {
                pending_chunks.push_back(std::move(c));
            }
        }
        return ok_status();
    });
    if (scan.is_err()) return std::move(scan).error();
    report.scan = scan.value();

    auto pruned = stores.tracker->prune_missing(candidates);
    if (pruned.is_err()) return std::move(pruned).error();
    std::set<std::string> gone(pruned.value().begin(), pruned.value().end());
    gone.insert(stores.tracker->dropped().begin(), stores.tracker->dropped().end());
    for (const auto& path : gone) {
        SIFT_TRY(stores.lexical->remove(path));
        SIFT_TRY(stores.symbols->remove(path));
    }
    report.scan.files_removed = gone.size();

    SIFT_TRY(tx.commit());
    stores.db.close();

    if (dense) {
        Result<DenseUpdateStats> updated = report.dense_full_rebuild
            ? dense->build_or_update(chunk_all(paths_, cfg_, candidates), *adapter)
            : dense->update_sources(pending_chunks, touched, *adapter);

        if (updated.is_err()) {
            // The tracker already moved on; force a full rebuild next time.
            log::warn("embedding failed, dense index dropped: %s",
                      updated.error().message.c_str());
            report.degraded.push_back(kSourceVector);
            remove_file(paths_.dense_index);
            dense.reset();
        } else {
            report.dense = updated.value();
            report.dense.pruned += dense->remove_sources(gone);

            bool dirty = report.dense_full_rebuild || report.dense.embedded > 0 ||
                         report.dense.pruned > 0;
            if (dirty) SIFT_TRY(dense->save(paths_.dense_index));
            report.dense_vectors = dense->size();
        }
    }

    AnnBackendChoice choice = resolve_ann_backend(cfg_.dense.backend);
    report.ann_backend = ann_backend_name(choice.kind);
    if (dense && choice.kind == AnnBackendKind::Hnsw) {
        AnnCache cache(paths_.ann_index, make_ann_backend(choice.kind));
        auto refreshed = cache.refresh(*dense);
        if (refreshed.is_err()) {
            log::warn("ann index not built: %s", refreshed.error().message.c_str());
            report.degraded.push_back("ann");
        } else {
            report.ann_rebuilt = refreshed.value();
        }
    } else if (dense && choice.kind == AnnBackendKind::Unavailable) {
        log::warn("ann backend unavailable (%s), using exact scan", choice.reason.c_str());
        report.degraded.push_back("ann");
    }

    auto graph = graph_store().build();
    if (graph.is_err()) return std::move(graph).error();
    report.graph = graph.value();
    SIFT_TRY(save_build_report(report, paths_.index_stats).context("build stats"));

    log::info("build: %zu seen, %zu indexed, %zu unchanged, %zu skipped, %zu removed",
              report.scan.files_seen, report.scan.files_indexed, report.scan.files_unchanged,
              report.scan.files_skipped, report.scan.files_removed);
    return Result<BuildReport>::ok(std::move(report));
}

Result<SearchResponse> Engine::search(const std::string& query, std::optional<size_t> limit,
                                      std::optional<int> context_lines,
                                      std::optional<SearchMode> mode) {
    SearchOptions opts;
    if (mode) {
        opts.mode = *mode;
    } else if (!parse_search_mode(cfg_.search.mode, opts.mode)) {
        return SiftError(SiftError::Config, "unknown search.mode '" + cfg_.search.mode + "'",
                         "use fts, vector or hybrid");
    }
    opts.limit = limit.value_or(static_cast<size_t>(cfg_.search.limit));
    opts.context_lines = context_lines.value_or(cfg_.search.context_lines);
    opts.candidate_multiplier = cfg_.search.candidate_multiplier;
    if (opts.limit == 0) {
        return SiftError(SiftError::InvalidArg, "search limit must be positive");
    }

    SearchResponse resp;
    if (unique_tokens(query).empty()) {
        resp.status = SearchStatus::EmptyQuery;
        return Result<SearchResponse>::ok(std::move(resp));
    }
    std::error_code ec;
    if (!fs::is_regular_file(paths_.index_db, ec)) {
        resp.status = SearchStatus::IndexMissing;
        return Result<SearchResponse>::ok(std::move(resp));
    }

    IndexStores stores;
    SIFT_TRY(open_index(stores, paths_, cfg_));

    std::unique_ptr<EmbeddingAdapter> adapter;
    std::optional<DenseIndex> dense;
    std::unique_ptr<AnnCache> ann;
    if (cfg_.dense.enabled && opts.mode != SearchMode::Fts) {
        auto made = make_embedding_adapter(cfg_.dense);
        if (made.is_ok()) {
            adapter = std::move(made).value();
            auto loaded = DenseIndex::load(paths_.dense_index, *adapter, cfg_.dense.backend);
            if (loaded.is_ok()) {
                dense = std::move(loaded).value();
            } else {
                log::debug("dense source off: %s", loaded.error().message.c_str());
            }
        } else {
            log::debug("dense source off: %s", made.error().message.c_str());
        }
        AnnBackendChoice choice = resolve_ann_backend(cfg_.dense.backend);
        if (dense && choice.kind == AnnBackendKind::Hnsw) {
            ann = std::make_unique<AnnCache>(paths_.ann_index, make_ann_backend(choice.kind));
        }
    }

    RetrievalSources src;
    src.symbols = stores.symbols.get();
    src.lexical = stores.lexical.get();
    src.dense = dense ? &*dense : nullptr;
    src.ann = ann.get();
    src.embedder = adapter.get();
    uint64_t max_bytes = cfg_.index.max_file_bytes;
    fs::path root = root_;
    src.read_file = [root, max_bytes](const std::string& path) {
        return read_source_file(root, path, max_bytes);
    };

    HybridRetriever retriever(std::move(src), opts);
    return Result<SearchResponse>::ok(retriever.search(query));
}

Result<std::vector<std::string>> Engine::impacted_files(const std::vector<std::string>& changed,
                                                        std::optional<size_t> depth) {
    std::vector<std::string> seeds;
    for (const auto& c : changed) seeds.push_back(relative_path(c));

    size_t d = depth.value_or(static_cast<size_t>(cfg_.tests.impact_depth));
    auto impacted = graph_store().impacted(seeds, d);
    if (impacted.is_err()) return std::move(impacted).error();
    return Result<std::vector<std::string>>::ok(
        std::vector<std::string>(impacted.value().begin(), impacted.value().end()));
}

Result<TestSelection> Engine::select_tests(const std::vector<std::string>& changed,
                                           std::optional<size_t> max_tests) {
    SelectorOptions opts;
    opts.max_tests = max_tests.value_or(static_cast<size_t>(cfg_.tests.max_tests));
    opts.fallback_count = static_cast<size_t>(cfg_.tests.fallback_count);
    if (opts.max_tests == 0) {
        return SiftError(SiftError::InvalidArg, "max_tests must be positive");
    }

    std::vector<std::string> seeds;
    for (const auto& c : changed) seeds.push_back(relative_path(c));

    auto impacted = graph_store().impacted(seeds, static_cast<size_t>(cfg_.tests.impact_depth));
    if (impacted.is_err()) return std::move(impacted).error();

    auto files = list_candidate_files(root_, cfg_.index);
    if (files.is_err()) return std::move(files).error();

    TestSelection sel = rank_tests(seeds, impacted.value(), discover_tests(files.value()), opts);
    log::debug("tests: %zu impacted, %zu of %zu selected%s", sel.impacted_files.size(),
               sel.selected_tests.size(), sel.all_tests_count,
               sel.used_fallback ? " (fallback)" : "");
    return Result<TestSelection>::ok(std::move(sel));
}

Result<std::string> Engine::dependency_tree(const std::string& path) {
    ImportGraphStore store = graph_store();
    auto graph = store.exists() ? store.load() : store.build_in_memory();
    if (graph.is_err()) return std::move(graph).error();
    std::string rel = relative_path(path);
    if (!graph.value().has_node(rel)) {
        return Result<std::string>::ok(rel + "\n");
    }
    return Result<std::string>::ok(graph.value().tree_display(rel));
}

Result<BuildReport> build(const fs::path& repo_root) {
    SIFT_TRY_ASSIGN(Engine engine, Engine::open(repo_root));
    return engine.build();
}

Result<SearchResponse> search(const fs::path& repo_root, const std::string& query,
                              size_t limit, int context_lines, SearchMode mode) {
    SIFT_TRY_ASSIGN(Engine engine, Engine::open(repo_root));
    return engine.search(query, limit, context_lines, mode);
}

Result<TestSelection> select_tests(const fs::path& repo_root,
                                   const std::vector<std::string>& changed_files,
                                   size_t max_tests) {
    SIFT_TRY_ASSIGN(Engine engine, Engine::open(repo_root));
    return engine.select_tests(changed_files, max_tests);
}

Result<std::vector<std::string>> impacted_files(const fs::path& repo_root,
                                                const std::vector<std::string>& changed_files,
                                                size_t depth) {
    SIFT_TRY_ASSIGN(Engine engine, Engine::open(repo_root));
    return engine.impacted_files(changed_files, depth);
}

} // namespace sift
