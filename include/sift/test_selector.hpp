#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace sift {

struct ScoredTest {
    std::string path;
    int score = 0;
};

struct TestSelection {
    std::vector<std::string> changed_files;
    std::vector<std::string> impacted_files;    // sorted
    std::vector<ScoredTest> selected_tests;
    size_t all_tests_count = 0;
    bool used_fallback = false;
};

// Recognizes test files by name: test_*.py, *_test.py, *_test.go,
// *.test.* / *.spec.* for JS/TS, *_test.{c,cc,cpp}, test_*.{c,cc,cpp},
// *Test.java, *Tests.java, *_spec.rb, *_test.rs.
bool is_test_file(const std::string& rel_path);

// Sorted test files among `files`.
std::vector<std::string> discover_tests(const std::vector<std::string>& files);

// Name with test prefixes and suffixes removed, lowercase ("test_parser.py"
// -> "parser", "WidgetTests.java" -> "widget").
std::string test_core_name(const std::string& rel_path);

bool is_end_to_end(const std::string& rel_path);

// Over every impacted file: +2 same top-level directory, +3 same parent
// directory, +1 when the file stem and the test's core name overlap. End to
// end style tests lose 3 once.
int score_test(const std::string& test, const std::set<std::string>& impacted);

struct SelectorOptions {
    size_t max_tests = 20;
    size_t fallback_count = 5;
};

// Ranks `tests` against `impacted`. Positive scores win, ordered by score
// then path. With none, the first min(fallback_count, max_tests) tests in path
// order are returned so the selection is never empty while tests exist.
TestSelection rank_tests(const std::vector<std::string>& changed,
                         const std::set<std::string>& impacted,
                         const std::vector<std::string>& tests,
                         const SelectorOptions& opts);

} // namespace sift
