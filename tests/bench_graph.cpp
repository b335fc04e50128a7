#include <catch2/catch.hpp>
#include <sift/graph.hpp>
#include <chrono>

using namespace sift;

TEST_CASE("graph perf: reverse walk of a 10K chain under 50ms", "[graph][bench]") {
    // 0 -> 1 -> 2 -> ... -> 9999
    Graph<int> g;
    for (int i = 0; i < 10000; ++i) {
        g.add_node(i);
    }
    for (size_t i = 0; i < 9999; ++i) {
        g.add_edge(i, i + 1);
    }

    auto start = std::chrono::high_resolution_clock::now();
    auto r = g.reverse_reachable({9999}, 100000);
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(r.size() == 10000);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Reverse walk 10K chain: " << ms << " ms");
    REQUIRE(ms < 50);
}

TEST_CASE("graph perf: impacted set of a wide import fan-in under 50ms", "[graph][bench]") {
    // 100 modules each imported by 99 leaves; every module imports core.py.
    PathGraph g;
    for (int m = 0; m < 100; ++m) {
        std::string mod = "mod" + std::to_string(m) + ".py";
        g.add_edge(mod, "core.py");
        for (int l = 0; l < 99; ++l) {
            g.add_edge("leaf" + std::to_string(m) + "_" + std::to_string(l) + ".py", mod);
        }
    }
    REQUIRE(g.node_count() == 10001);

    auto start = std::chrono::high_resolution_clock::now();
    auto impacted = g.impacted({"core.py"}, 6);
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(impacted.size() == 10001);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Impacted fan-in 10K: " << ms << " ms");
    REQUIRE(ms < 50);
}
