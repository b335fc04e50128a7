#include <sift/engine.hpp>
#include <sift/log.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace sift;

static void usage() {
    std::cerr <<
        "Usage: sift [-C <repo>] [-v] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  build                          index the repository\n"
        "  search <query> [-n N] [-c N] [-m fts|vector|hybrid]\n"
        "                                 ranked hits (limit, context lines, sources)\n"
        "  impact <file>... [-d N]        files reaching the given files\n"
        "  tests <file>... [-n N]         tests to run for the given changes\n"
        "  deps <file>                    import tree of one file\n";
}

static int fail(const SiftError& e) {
    std::cerr << e.format() << "\n";
    return 1;
}

static bool parse_count(const std::string& s, long& out) {
    char* end = nullptr;
    out = std::strtol(s.c_str(), &end, 10);
    return end && *end == '\0' && out >= 0;
}

static void print_hit(const Hit& h) {
    std::cout << h.path;
    if (h.start_line && h.end_line) {
        std::cout << ":" << *h.start_line << "-" << *h.end_line;
    }
    std::cout << "  score=" << h.score << "  [";
    bool first = true;
    for (const auto& s : h.sources) {
        std::cout << (first ? "" : ",") << s;
        first = false;
    }
    std::cout << "]";
    if (h.symbol) std::cout << "  " << hit_kind_name(h.kind) << " " << *h.symbol;
    std::cout << "\n";
    if (h.snippet && !h.snippet->empty()) {
        size_t start = 0;
        while (start < h.snippet->size()) {
            size_t nl = h.snippet->find('\n', start);
            if (nl == std::string::npos) nl = h.snippet->size();
            std::cout << "    | " << h.snippet->substr(start, nl - start) << "\n";
            start = nl + 1;
        }
    }
}

int main(int argc, char* argv[]) {
    log::init_from_env();

    std::string repo = ".";
    bool verbose = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-C" && i + 1 < argc) {
            repo = argv[++i];
        } else if (a == "-v") {
            verbose = true;
        } else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) {
        usage();
        return 1;
    }

    std::string cmd = args[0];
    std::vector<std::string> rest;
    long n = -1;
    long c = -1;
    std::optional<SearchMode> mode;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        if ((a == "-n" || a == "-d") && i + 1 < args.size()) {
            if (!parse_count(args[++i], n)) {
                std::cerr << "error: " << a << " expects a non-negative number\n";
                return 1;
            }
        } else if (a == "-c" && i + 1 < args.size()) {
            if (!parse_count(args[++i], c)) {
                std::cerr << "error: -c expects a non-negative number\n";
                return 1;
            }
        } else if (a == "-m" && i + 1 < args.size()) {
            SearchMode m;
            if (!parse_search_mode(args[++i], m)) {
                std::cerr << "error: -m expects fts, vector or hybrid\n";
                return 1;
            }
            mode = m;
        } else {
            rest.push_back(a);
        }
    }

    auto opened = Engine::open(repo);
    if (opened.is_err()) return fail(opened.error());
    // -v wins over the configured level.
    if (verbose) log::set_level(log::Debug);
    Engine& engine = opened.value();

    if (cmd == "build") {
        auto r = engine.build();
        if (r.is_err()) return fail(r.error());
        const BuildReport& b = r.value();
        std::cout << "files: " << b.scan.files_seen << " seen, "
                  << b.scan.files_indexed << " indexed, "
                  << b.scan.files_unchanged << " unchanged, "
                  << b.scan.files_skipped << " skipped, "
                  << b.scan.files_removed << " removed\n";
        std::cout << "fulltext: " << b.fulltext_backend << "\n";
        if (b.dense_enabled) {
            std::cout << "dense: " << b.dense_vectors << " vectors ("
                      << b.dense.embedded << " embedded, " << b.dense.reused << " reused, "
                      << b.dense.pruned << " pruned" << (b.dense_full_rebuild ? ", full" : "")
                      << ")\n";
            std::cout << "ann: " << b.ann_backend << (b.ann_rebuilt ? " (rebuilt)" : "") << "\n";
        }
        std::cout << "graph: " << b.graph.updated_files << " updated, "
                  << b.graph.edges_added << " edges added\n";
        for (const auto& d : b.degraded) std::cout << "degraded: " << d << "\n";
        std::cout << "stats: " << engine.paths().index_stats.string() << "\n";
        return 0;
    }

    if (cmd == "search") {
        if (rest.empty()) {
            usage();
            return 1;
        }
        std::string query;
        for (const auto& w : rest) query += (query.empty() ? "" : " ") + w;
        std::optional<size_t> limit;
        std::optional<int> context;
        if (n >= 0) limit = static_cast<size_t>(n);
        if (c >= 0) context = static_cast<int>(c);

        auto r = engine.search(query, limit, context, mode);
        if (r.is_err()) return fail(r.error());
        const SearchResponse& resp = r.value();
        if (resp.status != SearchStatus::Ok) {
            std::cout << search_status_name(resp.status) << "\n";
            return resp.status == SearchStatus::IndexMissing ? 2 : 0;
        }
        for (const auto& h : resp.hits) print_hit(h);
        for (const auto& d : resp.degraded) std::cerr << "degraded: " << d << "\n";
        return 0;
    }

    if (cmd == "impact") {
        std::optional<size_t> depth;
        if (n >= 0) depth = static_cast<size_t>(n);
        auto r = engine.impacted_files(rest, depth);
        if (r.is_err()) return fail(r.error());
        for (const auto& p : r.value()) std::cout << p << "\n";
        return 0;
    }

    if (cmd == "tests") {
        std::optional<size_t> max_tests;
        if (n >= 0) max_tests = static_cast<size_t>(n);
        auto r = engine.select_tests(rest, max_tests);
        if (r.is_err()) return fail(r.error());
        const TestSelection& sel = r.value();
        for (const auto& t : sel.selected_tests) {
            std::cout << t.path << "  score=" << t.score << "\n";
        }
        std::cerr << sel.selected_tests.size() << " of " << sel.all_tests_count << " tests, "
                  << sel.impacted_files.size() << " impacted files"
                  << (sel.used_fallback ? " (fallback)" : "") << "\n";
        return 0;
    }

    if (cmd == "deps") {
        if (rest.size() != 1) {
            usage();
            return 1;
        }
        auto r = engine.dependency_tree(rest[0]);
        if (r.is_err()) return fail(r.error());
        std::cout << r.value();
        return 0;
    }

    std::cerr << "error: unknown command '" << cmd << "'\n";
    usage();
    return 1;
}
