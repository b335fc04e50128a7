#include <catch2/catch.hpp>
#include <sift/chunker.hpp>

using namespace sift;

TEST_CASE("Chunk ids encode source and offset", "[chunker]") {
    CHECK(make_chunk_id("src/a.py", 780) == "src/a.py::off780");
}

TEST_CASE("Windows advance by size minus overlap", "[chunker]") {
    ChunkConfig cfg;
    cfg.size = 100;
    cfg.overlap = 20;
    cfg.min_chars = 10;

    std::string content(250, 'x');
    auto chunks = chunk_text("a.txt", content, cfg);
    REQUIRE(chunks.size() == 4);
    CHECK(chunks[0].offset == 0);
    CHECK(chunks[1].offset == 80);
    CHECK(chunks[2].offset == 160);
    CHECK(chunks[3].offset == 240);
    CHECK(chunks[0].content.size() == 100);
    CHECK(chunks[2].content.size() == 90);
    CHECK(chunks[3].content.size() == 10);
    CHECK(chunks[1].chunk_id == "a.txt::off80");
}

TEST_CASE("Short or blank windows are dropped", "[chunker]") {
    ChunkConfig cfg;
    CHECK(chunk_text("a.txt", "tiny file\n", cfg).empty());
    CHECK(chunk_text("a.txt", std::string(2000, ' '), cfg).empty());
    CHECK(chunk_text("a.txt", "", cfg).empty());
}

TEST_CASE("Chunks record their starting line", "[chunker]") {
    ChunkConfig cfg;
    cfg.size = 40;
    cfg.overlap = 0;
    cfg.min_chars = 1;

    std::string content;
    for (int i = 0; i < 20; ++i) content += "line " + std::to_string(i) + " padding\n";
    auto chunks = chunk_text("a.txt", content, cfg);
    REQUIRE(chunks.size() > 2);
    CHECK(chunks[0].line == 1);
    for (const auto& c : chunks) {
        int expected = 1;
        for (size_t i = 0; i < c.offset; ++i) {
            if (content[i] == '\n') ++expected;
        }
        CHECK(c.line == expected);
    }
}

TEST_CASE("chunk_map keys by chunk id", "[chunker]") {
    ChunkConfig cfg;
    cfg.min_chars = 1;
    auto chunks = chunk_text("a.py", "print('hello')\n", cfg);
    auto m = chunk_map(chunks);
    REQUIRE(m.size() == 1);
    CHECK(m.at("a.py::off0") == "print('hello')\n");
}
