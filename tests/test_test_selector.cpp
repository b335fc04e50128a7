#include <catch2/catch.hpp>
#include <sift/test_selector.hpp>

using namespace sift;

TEST_CASE("is_test_file recognises common conventions", "[tests]") {
    CHECK(is_test_file("tests/test_parser.py"));
    CHECK(is_test_file("pkg/parser_test.py"));
    CHECK(is_test_file("net/conn_test.go"));
    CHECK(is_test_file("web/app.test.ts"));
    CHECK(is_test_file("web/app.spec.jsx"));
    CHECK(is_test_file("src/test_lexer.cpp"));
    CHECK(is_test_file("src/main/WidgetTest.java"));
    CHECK(is_test_file("src/main/WidgetTests.java"));
    CHECK(is_test_file("spec/user_spec.rb"));
    CHECK(is_test_file("src/parse_test.rs"));

    CHECK_FALSE(is_test_file("src/parser.py"));
    CHECK_FALSE(is_test_file("src/testing.py"));
    CHECK_FALSE(is_test_file("docs/test_plan.md"));
    CHECK_FALSE(is_test_file("web/latest.ts"));
}

TEST_CASE("discover_tests returns sorted test paths", "[tests]") {
    auto tests = discover_tests({"z/test_b.py", "src/a.py", "a/test_a.py"});
    CHECK(tests == std::vector<std::string>{"a/test_a.py", "z/test_b.py"});
}

TEST_CASE("test_core_name strips test affixes", "[tests]") {
    CHECK(test_core_name("tests/test_parser.py") == "parser");
    CHECK(test_core_name("pkg/lexer_test.go") == "lexer");
    CHECK(test_core_name("web/App.test.tsx") == "app");
    CHECK(test_core_name("x/WidgetTests.java") == "widget");
    CHECK(test_core_name("spec/user_spec.rb") == "user");
}

TEST_CASE("score_test weighs directory and name proximity", "[tests]") {
    std::set<std::string> impacted{"src/parser.py"};
    CHECK(score_test("src/test_parser.py", impacted) == 6);
    CHECK(score_test("src/test_other.py", impacted) == 5);
    CHECK(score_test("tests/test_parser.py", impacted) == 1);
    CHECK(score_test("tests/test_other.py", impacted) == 0);
    CHECK(score_test("tests/e2e/test_parser.py", impacted) == -2);
}

TEST_CASE("Root-level files share no top-level directory", "[tests]") {
    std::set<std::string> impacted{"setup.py", "parser.py"};
    // Same (root) parent directory for both, stem overlap with parser.py only.
    CHECK(score_test("test_parser.py", impacted) == 7);
    CHECK(score_test("test_other.py", impacted) == 6);
    CHECK(score_test("src/test_setup.py", {"setup.py"}) == 1);
    CHECK(score_test("test_setup.py", {"src/setup.py"}) == 1);
}

TEST_CASE("End to end markers", "[tests]") {
    CHECK(is_end_to_end("tests/e2e/test_login.py"));
    CHECK(is_end_to_end("tests/test_integration_db.py"));
    CHECK_FALSE(is_end_to_end("tests/test_login.py"));
}

TEST_CASE("rank_tests orders by score then path", "[tests]") {
    std::vector<std::string> tests{"tests/test_parser.py", "src/test_parser.py",
                                   "src/test_other.py", "tests/test_unrelated.py"};
    std::set<std::string> impacted{"src/parser.py"};
    SelectorOptions opts;

    auto sel = rank_tests({"src/parser.py"}, impacted, tests, opts);
    CHECK_FALSE(sel.used_fallback);
    CHECK(sel.all_tests_count == 4);
    CHECK(sel.impacted_files == std::vector<std::string>{"src/parser.py"});
    REQUIRE(sel.selected_tests.size() == 3);
    CHECK(sel.selected_tests[0].path == "src/test_parser.py");
    CHECK(sel.selected_tests[1].path == "src/test_other.py");
    CHECK(sel.selected_tests[2].path == "tests/test_parser.py");

    opts.max_tests = 1;
    auto capped = rank_tests({"src/parser.py"}, impacted, tests, opts);
    REQUIRE(capped.selected_tests.size() == 1);
    CHECK(capped.selected_tests[0].path == "src/test_parser.py");
}

TEST_CASE("rank_tests falls back when nothing scores", "[tests]") {
    std::vector<std::string> tests;
    for (int i = 0; i < 8; ++i) tests.push_back("qa/test_case" + std::to_string(i) + ".py");
    SelectorOptions opts;

    auto sel = rank_tests({"lib/zzz.py"}, {"lib/zzz.py"}, tests, opts);
    CHECK(sel.used_fallback);
    REQUIRE(sel.selected_tests.size() == 5);
    CHECK(sel.selected_tests[0].path == "qa/test_case0.py");
    CHECK(sel.selected_tests[0].score == 0);

    opts.max_tests = 2;
    CHECK(rank_tests({"lib/zzz.py"}, {"lib/zzz.py"}, tests, opts).selected_tests.size() == 2);

    auto none = rank_tests({"lib/zzz.py"}, {"lib/zzz.py"}, {}, SelectorOptions{});
    CHECK(none.selected_tests.empty());
    CHECK_FALSE(none.used_fallback);
}
