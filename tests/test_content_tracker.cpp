#include <catch2/catch.hpp>
#include <sift/content_tracker.hpp>
#include "support/temp_repo.hpp"

using namespace sift;
using sift_test::TempRepo;

namespace {

struct TrackerFixture {
    TempRepo repo{"tracker"};
    Database db;
    IndexConfig cfg;

    TrackerFixture() {
        REQUIRE(db.open((repo.root() / ".sift" / "index.db").string()).is_ok());
    }

    ContentTracker tracker() {
        ContentTracker t(db, repo.root(), cfg);
        REQUIRE(t.open().is_ok());
        return t;
    }
};

Result<ScanStats> scan_all(ContentTracker& t, std::vector<std::string>* seen = nullptr) {
    auto files = t.list_candidate_files();
    if (files.is_err()) return std::move(files).error();
    return t.scan(files.value(), [seen](const ChangedFile& f) -> Status {
        if (seen) seen->push_back(f.path);
        return ok_status();
    });
}

} // namespace

TEST_CASE_METHOD(TrackerFixture, "Candidate listing honours excludes and extensions",
                 "[tracker]") {
    repo.write("src/a.py", "x = 1\n");
    repo.write("src/b.PY", "y = 2\n");
    repo.write("node_modules/dep/index.js", "module.exports = 1\n");
    repo.write(".git/config", "[core]\n");
    repo.write("image.png", "not really\n");
    repo.write("README", "no extension\n");

    auto files = list_candidate_files(repo.root(), cfg);
    REQUIRE(files.is_ok());
    CHECK(files.value() == std::vector<std::string>{"src/a.py", "src/b.PY"});
}

TEST_CASE_METHOD(TrackerFixture, "Listing a missing root is NotFound", "[tracker]") {
    auto files = list_candidate_files(repo.path("nope"), cfg);
    REQUIRE(files.is_err());
    CHECK(files.error().code == SiftError::NotFound);
}

TEST_CASE_METHOD(TrackerFixture, "Second scan of an unchanged tree indexes nothing",
                 "[tracker]") {
    for (int i = 0; i < 10; ++i) {
        repo.write("pkg/mod" + std::to_string(i) + ".py",
                   "def f" + std::to_string(i) + "():\n    return " +
                   std::to_string(i) + "\n");
    }
    auto t = tracker();

    std::vector<std::string> seen;
    auto first = scan_all(t, &seen);
    REQUIRE(first.is_ok());
    CHECK(first.value().files_indexed == 10);
    CHECK(seen.size() == 10);
    CHECK(t.added().size() == 10);

    seen.clear();
    auto second = scan_all(t, &seen);
    REQUIRE(second.is_ok());
    CHECK(second.value().files_indexed == 0);
    CHECK(second.value().files_unchanged == 10);
    CHECK(seen.empty());
    CHECK(t.added().empty());
}

TEST_CASE_METHOD(TrackerFixture, "Edited content is reported with its new hash",
                 "[tracker]") {
    repo.write("a.py", "one\n");
    auto t = tracker();
    REQUIRE(scan_all(t).is_ok());
    auto before = t.get("a.py");
    REQUIRE(before.is_ok());
    REQUIRE(before.value().has_value());

    repo.write("a.py", "two, longer\n");
    std::vector<ChangedFile> changed;
    auto files = t.list_candidate_files();
    REQUIRE(files.is_ok());
    auto stats = t.scan(files.value(), [&](const ChangedFile& f) -> Status {
        changed.push_back(f);
        return ok_status();
    });
    REQUIRE(stats.is_ok());
    REQUIRE(changed.size() == 1);
    CHECK(changed[0].content == "two, longer\n");
    CHECK(changed[0].content_hash != before.value()->content_hash);

    auto after = t.get("a.py");
    REQUIRE(after.is_ok());
    CHECK(after.value()->content_hash == changed[0].content_hash);
}

TEST_CASE_METHOD(TrackerFixture, "A visitor error aborts the scan and keeps the old record",
                 "[tracker]") {
    repo.write("a.py", "content\n");
    auto t = tracker();
    auto files = t.list_candidate_files();
    REQUIRE(files.is_ok());
    auto stats = t.scan(files.value(), [](const ChangedFile&) -> Status {
        return SiftError(SiftError::Database, "index write failed");
    });
    REQUIRE(stats.is_err());
    CHECK(stats.error().code == SiftError::Database);

    auto rec = t.get("a.py");
    REQUIRE(rec.is_ok());
    CHECK_FALSE(rec.value().has_value());
}

TEST_CASE_METHOD(TrackerFixture, "Binary and oversized files are skipped", "[tracker]") {
    cfg.max_file_bytes = 64;
    repo.write("bin.txt", std::string("ab\0cd", 5));
    repo.write("big.txt", std::string(200, 'x'));
    repo.write("ok.txt", "fine\n");
    auto t = tracker();

    std::vector<std::string> seen;
    auto stats = scan_all(t, &seen);
    REQUIRE(stats.is_ok());
    CHECK(stats.value().files_skipped == 2);
    CHECK(seen == std::vector<std::string>{"ok.txt"});

    auto big = t.read_text("big.txt");
    REQUIRE(big.is_err());
    CHECK(big.error().code == SiftError::Unavailable);
}

TEST_CASE_METHOD(TrackerFixture, "prune_missing drops deleted files", "[tracker]") {
    repo.write("a.py", "a\n");
    repo.write("b.py", "b\n");
    auto t = tracker();
    REQUIRE(scan_all(t).is_ok());

    repo.remove("b.py");
    auto files = t.list_candidate_files();
    REQUIRE(files.is_ok());
    auto removed = t.prune_missing(files.value());
    REQUIRE(removed.is_ok());
    CHECK(removed.value() == std::vector<std::string>{"b.py"});

    auto records = t.all();
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 1);
    CHECK(records.value()[0].path == "a.py");
}

TEST_CASE_METHOD(TrackerFixture, "clear forces a full re-index", "[tracker]") {
    repo.write("a.py", "a\n");
    auto t = tracker();
    REQUIRE(scan_all(t).is_ok());
    REQUIRE(t.clear().is_ok());

    auto stats = scan_all(t);
    REQUIRE(stats.is_ok());
    CHECK(stats.value().files_indexed == 1);
}

TEST_CASE_METHOD(TrackerFixture, "A tracked file that turns binary or oversized is dropped",
                 "[tracker]") {
    cfg.max_file_bytes = 64;
    repo.write("a.py", "a = 1\n");
    repo.write("b.py", "b = 2\n");
    repo.write("c.py", "c = 3\n");
    auto t = tracker();
    REQUIRE(scan_all(t).is_ok());

    repo.write("a.py", std::string(200, '#'));
    repo.write("b.py", std::string("b = \0 2\n", 8));

    auto stats = scan_all(t);
    REQUIRE(stats.is_ok());
    CHECK(stats.value().files_skipped == 2);
    CHECK(stats.value().files_unchanged == 1);
    CHECK(t.dropped() == std::vector<std::string>{"a.py", "b.py"});

    auto records = t.all();
    REQUIRE(records.is_ok());
    REQUIRE(records.value().size() == 1);
    CHECK(records.value()[0].path == "c.py");

    // Never recorded again, so nothing more to drop.
    auto again = scan_all(t);
    REQUIRE(again.is_ok());
    CHECK(again.value().files_skipped == 2);
    CHECK(t.dropped().empty());
}
