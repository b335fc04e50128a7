#include <catch2/catch.hpp>
#include <sift/content_tracker.hpp>
#include <sift/engine.hpp>
#include "support/temp_repo.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <map>
#include <set>

using namespace sift;
using sift_test::TempRepo;

namespace {

// Ten small Python modules, a chain of imports and a few tests. Each module
// carries a docstring so it is long enough to be chunked.
std::string module(const std::string& doc, const std::string& body) {
    return "\"\"\"" + doc + "\n\nThis module is part of the engine fixture repository.\n\"\"\"\n" +
           body;
}

struct EngineFixture {
    TempRepo repo{"engine"};

    EngineFixture() {
        repo.write("app/__init__.py", "");
        repo.write("app/config.py", module("Configuration loading.",
            "import os\n\n"
            "def load_config(path):\n"
            "    return open(path).read()\n"));
        repo.write("app/server.py", module("Server lifecycle.",
            "from app import config\n\n"
            "class Server:\n"
            "    def start(self):\n"
            "        return config.load_config('app.toml')\n"));
        repo.write("app/cli.py", module("Command line entry point.",
            "from app import server\n\n"
            "def main():\n"
            "    server.Server().start()\n"));
        repo.write("app/util.py", module("Numeric helpers.",
            "def clamp(x, lo, hi):\n    return max(lo, min(x, hi))\n"));
        repo.write("lib/strings.py", module("String helpers.",
            "def slugify(s):\n    return s.lower().replace(' ', '-')\n"));
        repo.write("tests/test_config.py", "from app import config\n");
        repo.write("tests/test_server.py", "from app import server\n");
        repo.write("tests/test_strings.py", "from lib import strings\n");
        repo.write("docs/readme.md", "Run the server with the cli entry point.\n");
    }

    Engine engine(Config cfg = Config{}) const { return Engine(repo.root(), std::move(cfg)); }
};

// path -> content hash of every record in index.db.
std::map<std::string, std::string> tracked_hashes(const Engine& e) {
    Database db;
    REQUIRE(db.open(e.paths().index_db.string()).is_ok());
    ContentTracker tracker(db, e.paths().root, IndexConfig{});
    REQUIRE(tracker.open().is_ok());
    auto records = tracker.all();
    REQUIRE(records.is_ok());
    std::map<std::string, std::string> out;
    for (const auto& r : records.value()) out[r.path] = r.content_hash;
    return out;
}

nlohmann::json dense_hashes(const Engine& e) {
    std::ifstream in(e.paths().dense_index);
    REQUIRE(in.is_open());
    nlohmann::json doc;
    in >> doc;
    return doc.at("hashes");
}

std::vector<std::string> selected_paths(const TestSelection& sel) {
    std::vector<std::string> out;
    for (const auto& t : sel.selected_tests) out.push_back(t.path);
    return out;
}

} // namespace

TEST_CASE("StorePaths layout", "[engine]") {
    auto p = StorePaths::for_root("/repo");
    CHECK(p.index_db.generic_string() == "/repo/.sift/index/index.db");
    CHECK(p.index_stats.generic_string() == "/repo/.sift/index/index_stats.json");
    CHECK(p.dense_index.generic_string() == "/repo/.sift/kb/dense_index.json");
    CHECK(p.ann_index.generic_string() == "/repo/.sift/kb/ann_index.bin");
    CHECK(p.graph_db.generic_string() == "/repo/.sift/graph/graph.db");
    CHECK(p.config_file.generic_string() == "/repo/.sift/config.toml");
}

TEST_CASE_METHOD(EngineFixture, "A second build of an unchanged tree does no work", "[engine]") {
    Engine e = engine();
    auto first = e.build();
    REQUIRE(first.is_ok());
    CHECK(first.value().scan.files_seen == 10);
    CHECK(first.value().scan.files_indexed == 10);
    CHECK(first.value().dense_enabled);
    CHECK(first.value().dense_full_rebuild);
    CHECK(first.value().dense_vectors > 0);
    CHECK(first.value().degraded.empty());
    auto files_before = tracked_hashes(e);
    auto dense_before = dense_hashes(e);
    CHECK(files_before.size() == 10);

    auto second = e.build();
    REQUIRE(second.is_ok());
    CHECK(second.value().scan.files_indexed == 0);
    CHECK(second.value().scan.files_unchanged == 10);
    CHECK_FALSE(second.value().dense_full_rebuild);
    CHECK(second.value().dense.embedded == 0);
    CHECK(second.value().graph.updated_files == 0);
    CHECK(second.value().dense_vectors == first.value().dense_vectors);
    CHECK(tracked_hashes(e) == files_before);
    CHECK(dense_hashes(e) == dense_before);
}

TEST_CASE_METHOD(EngineFixture, "Edits and deletions are picked up incrementally", "[engine]") {
    Engine e = engine();
    REQUIRE(e.build().is_ok());

    repo.write("app/util.py", module("Numeric helpers, renamed.",
        "def clamp_value(x):\n    return x\n"));
    repo.remove("lib/strings.py");
    auto r = e.build();
    REQUIRE(r.is_ok());
    CHECK(r.value().scan.files_indexed == 1);
    CHECK(r.value().scan.files_removed == 1);
    CHECK(r.value().dense.pruned > 0);

    auto hits = e.search("clamp_value");
    REQUIRE(hits.is_ok());
    REQUIRE_FALSE(hits.value().hits.empty());
    CHECK(hits.value().hits[0].path == "app/util.py");

    auto gone = e.search("slugify");
    REQUIRE(gone.is_ok());
    for (const auto& h : gone.value().hits) CHECK(h.path != "lib/strings.py");
}

TEST_CASE_METHOD(EngineFixture, "A file that turns binary leaves every index", "[engine]") {
    Engine e = engine();
    auto first = e.build();
    REQUIRE(first.is_ok());

    repo.write("app/cli.py", std::string("\0\x01 compiled main entry\n", 23));
    auto r = e.build();
    REQUIRE(r.is_ok());
    CHECK(r.value().scan.files_removed == 1);
    CHECK(r.value().scan.files_skipped == 1);
    CHECK(r.value().dense.pruned > 0);
    CHECK(r.value().dense_vectors < first.value().dense_vectors);
    CHECK(tracked_hashes(e).count("app/cli.py") == 0);

    auto hits = e.search("main entry point");
    REQUIRE(hits.is_ok());
    for (const auto& h : hits.value().hits) CHECK(h.path != "app/cli.py");

    auto impacted = e.impacted_files({"app/server.py"});
    REQUIRE(impacted.is_ok());
    CHECK(std::find(impacted.value().begin(), impacted.value().end(), "app/cli.py")
          == impacted.value().end());
}

TEST_CASE_METHOD(EngineFixture, "Search before build reports a missing index", "[engine]") {
    Engine e = engine();
    auto r = e.search("load_config");
    REQUIRE(r.is_ok());
    CHECK(r.value().status == SearchStatus::IndexMissing);

    auto empty = e.search("  ");
    REQUIRE(empty.is_ok());
    CHECK(empty.value().status == SearchStatus::EmptyQuery);

    auto bad = e.search("x", size_t(0));
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == SiftError::InvalidArg);
}

TEST_CASE_METHOD(EngineFixture, "Search finds definitions with grounded snippets", "[engine]") {
    Engine e = engine();
    REQUIRE(e.build().is_ok());

    auto r = e.search("load_config", 5);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().status == SearchStatus::Ok);
    REQUIRE_FALSE(r.value().hits.empty());
    CHECK(r.value().hits.size() <= 5);
    const Hit& top = r.value().hits[0];
    CHECK(top.path == "app/config.py");
    CHECK(top.kind == HitKind::Pointer);
    REQUIRE(top.snippet);
    CHECK(top.snippet->find("def load_config") != std::string::npos);
}

TEST_CASE_METHOD(EngineFixture, "Impacted files follow importers", "[engine]") {
    Engine e = engine();
    REQUIRE(e.build().is_ok());

    auto r = e.impacted_files({"app/config.py"});
    REQUIRE(r.is_ok());
    CHECK(r.value() == std::vector<std::string>{"app/cli.py", "app/config.py", "app/server.py",
                                                "tests/test_config.py", "tests/test_server.py"});

    auto abs = e.impacted_files({(repo.root() / "app" / "cli.py").string()});
    REQUIRE(abs.is_ok());
    CHECK(abs.value() == std::vector<std::string>{"app/cli.py"});
}

TEST_CASE_METHOD(EngineFixture, "Impacted files work without a build", "[engine]") {
    Engine e = engine();
    auto r = e.impacted_files({"lib/strings.py"}, size_t(1));
    REQUIRE(r.is_ok());
    CHECK(r.value() == std::vector<std::string>{"lib/strings.py", "tests/test_strings.py"});
}

TEST_CASE_METHOD(EngineFixture, "Tests near the change are selected", "[engine]") {
    Engine e = engine();
    REQUIRE(e.build().is_ok());

    auto r = e.select_tests({"app/config.py"});
    REQUIRE(r.is_ok());
    const TestSelection& sel = r.value();
    CHECK(sel.all_tests_count == 3);
    CHECK_FALSE(sel.used_fallback);
    auto paths = selected_paths(sel);
    REQUIRE_FALSE(paths.empty());
    CHECK(paths[0] == "tests/test_config.py");
    CHECK(std::find(paths.begin(), paths.end(), "tests/test_strings.py") != paths.end());

    auto bad = e.select_tests({"app/config.py"}, size_t(0));
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == SiftError::InvalidArg);
}

TEST_CASE_METHOD(EngineFixture, "Dependency tree of a file", "[engine]") {
    Engine e = engine();
    REQUIRE(e.build().is_ok());
    auto tree = e.dependency_tree("app/cli.py");
    REQUIRE(tree.is_ok());
    CHECK(tree.value().rfind("app/cli.py\n", 0) == 0);
    CHECK(tree.value().find("app/server.py") != std::string::npos);
    CHECK(tree.value().find("app/config.py") != std::string::npos);
}

TEST_CASE_METHOD(EngineFixture, "Dense can be disabled", "[engine]") {
    Config cfg;
    cfg.dense.enabled = false;
    Engine e = engine(cfg);
    auto r = e.build();
    REQUIRE(r.is_ok());
    CHECK_FALSE(r.value().dense_enabled);
    CHECK_FALSE(std::filesystem::exists(e.paths().dense_index));

    auto hits = e.search("server");
    REQUIRE(hits.is_ok());
    CHECK_FALSE(hits.value().hits.empty());
}

TEST_CASE_METHOD(EngineFixture, "An unknown embedding provider degrades the build", "[engine]") {
    Config cfg;
    cfg.dense.provider = "remote_api";
    Engine e = engine(cfg);
    auto r = e.build();
    REQUIRE(r.is_ok());
    CHECK_FALSE(r.value().dense_enabled);
    CHECK(r.value().degraded == std::vector<std::string>{"vector"});
    CHECK(r.value().scan.files_indexed == 10);
}

TEST_CASE_METHOD(EngineFixture, "Switching the embedding model rebuilds the dense index",
                 "[engine]") {
    REQUIRE(engine().build().is_ok());

    Config cfg;
    cfg.dense.model = "hash-64";
    cfg.dense.dim = 64;
    auto r = engine(cfg).build();
    REQUIRE(r.is_ok());
    CHECK(r.value().scan.files_indexed == 0);
    CHECK(r.value().dense_full_rebuild);
    CHECK(r.value().dense.embedded > 0);
}

TEST_CASE_METHOD(EngineFixture, "Engine::open reads the repository config", "[engine]") {
    repo.write(".sift/config.toml", "[search]\nlimit = 3\n[tests]\nmax_tests = 2\n");
    auto e = Engine::open(repo.root());
    REQUIRE(e.is_ok());
    CHECK(e.value().config().search.limit == 3);
    CHECK(e.value().config().tests.max_tests == 2);

    auto missing = Engine::open(repo.path("does/not/exist"));
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == SiftError::NotFound);
}

TEST_CASE_METHOD(EngineFixture, "search.mode picks the passes, an explicit mode wins",
                 "[engine]") {
    Config cfg;
    cfg.search.mode = "vector";
    Engine e = engine(cfg);
    REQUIRE(e.build().is_ok());

    auto configured = e.search("load_config");
    REQUIRE(configured.is_ok());
    REQUIRE_FALSE(configured.value().hits.empty());
    for (const auto& h : configured.value().hits) {
        CHECK(h.sources == std::set<std::string>{kSourceVector});
    }

    auto fts = e.search("load_config", std::nullopt, std::nullopt, SearchMode::Fts);
    REQUIRE(fts.is_ok());
    REQUIRE_FALSE(fts.value().hits.empty());
    CHECK(fts.value().hits[0].kind == HitKind::Pointer);
    for (const auto& h : fts.value().hits) CHECK(h.sources.count(kSourceVector) == 0);

    cfg.search.mode = "semantic";
    auto bad = engine(cfg).search("load_config");
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == SiftError::Config);
}

TEST_CASE_METHOD(EngineFixture, "Each build writes its report beside the index", "[engine]") {
    Engine e = engine();
    auto first = e.build();
    REQUIRE(first.is_ok());

    auto read_stats = [&]() {
        std::ifstream in(e.paths().index_stats);
        REQUIRE(in.is_open());
        nlohmann::json doc;
        in >> doc;
        return doc;
    };
    auto doc = read_stats();
    CHECK(doc["files"]["seen"] == 10);
    CHECK(doc["files"]["indexed"] == 10);
    CHECK(doc["fulltext_backend"] == first.value().fulltext_backend);
    CHECK(doc["dense"]["vectors"] == first.value().dense_vectors);
    CHECK(doc["dense"]["full_rebuild"] == true);
    CHECK(doc["degraded"].size() == first.value().degraded.size());

    repo.remove("lib/strings.py");
    REQUIRE(e.build().is_ok());
    auto second = read_stats();
    CHECK(second["files"]["indexed"] == 0);
    CHECK(second["files"]["removed"] == 1);
    CHECK(second["dense"]["full_rebuild"] == false);
}
