#include <catch2/catch.hpp>
#include <sift/symbol_index.hpp>
#include "support/temp_repo.hpp"

using namespace sift;
using sift_test::TempRepo;

namespace {

const Symbol* find_symbol(const std::vector<Symbol>& syms, const std::string& name) {
    for (const auto& s : syms) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Python definitions span their indented block", "[symbols]") {
    auto syms = extract_symbols("app/auth.py",
        "import os\n"
        "\n"
        "class Session:\n"
        "    def open(self):\n"
        "        return 1\n"
        "\n"
        "    def close(self):\n"
        "        pass\n"
        "\n"
        "async def login(user):\n"
        "    return user\n");

    REQUIRE(syms.size() == 4);
    const Symbol* session = find_symbol(syms, "Session");
    REQUIRE(session);
    CHECK(session->kind == "class");
    CHECK(session->start_line == 3);
    CHECK(session->end_line == 8);

    const Symbol* login = find_symbol(syms, "login");
    REQUIRE(login);
    CHECK(login->kind == "function");
    CHECK(login->start_line == 10);
    CHECK(login->end_line == 11);
    CHECK(login->pointer_id == "app/auth.py#login:10");
}

TEST_CASE("Brace languages end at the matching brace", "[symbols]") {
    auto syms = extract_symbols("src/server.go",
        "package main\n"
        "\n"
        "type Server struct {\n"
        "\taddr string\n"
        "}\n"
        "\n"
        "func (s *Server) Start() error {\n"
        "\tif s.addr == \"\" {\n"
        "\t\treturn nil\n"
        "\t}\n"
        "\treturn nil\n"
        "}\n");

    const Symbol* server = find_symbol(syms, "Server");
    REQUIRE(server);
    CHECK(server->kind == "struct");
    CHECK(server->start_line == 3);
    CHECK(server->end_line == 5);

    const Symbol* start = find_symbol(syms, "Start");
    REQUIRE(start);
    CHECK(start->start_line == 7);
    CHECK(start->end_line == 12);
}

TEST_CASE("Control keywords are not functions", "[symbols]") {
    auto syms = extract_symbols("x.js",
        "function handle(req) {\n"
        "  if (req) {\n"
        "    return 1;\n"
        "  }\n"
        "}\n");
    REQUIRE(syms.size() == 1);
    CHECK(syms[0].name == "handle");
}

TEST_CASE("A 100KB minified line is skipped, later definitions still found", "[symbols]") {
    std::string args = "const f = (";
    while (args.size() < 100 * 1024) args += "a, b, c, ";
    auto syms = extract_symbols("dist/bundle.min.js",
        args + "\nfunction tail() {\n  return 1;\n}\n");
    REQUIRE(syms.size() == 1);
    CHECK(syms[0].name == "tail");
    CHECK(syms[0].start_line == 2);
    CHECK(syms[0].end_line == 4);
}

TEST_CASE("Unknown languages yield no symbols", "[symbols]") {
    CHECK(extract_symbols("notes.md", "def looks_like_python():\n").empty());
}

TEST_CASE("SymbolIndex lookup scores exact, prefix and substring", "[symbols]") {
    TempRepo repo("symbols");
    Database db;
    REQUIRE(db.open((repo.root() / "index.db").string()).is_ok());
    SymbolIndex idx(db);
    REQUIRE(idx.open().is_ok());

    REQUIRE(idx.replace("a.py", extract_symbols("a.py",
        "def parse():\n    pass\n"
        "def parse_config():\n    pass\n"
        "def reparse():\n    pass\n")).is_ok());

    auto hits = idx.lookup({"parse"}, 10);
    REQUIRE(hits.is_ok());
    REQUIRE(hits.value().size() == 3);
    CHECK(hits.value()[0].symbol.name == "parse");
    CHECK(hits.value()[0].score == Approx(1.0));
    CHECK(hits.value()[1].symbol.name == "parse_config");
    CHECK(hits.value()[1].score == Approx(0.6));
    CHECK(hits.value()[2].symbol.name == "reparse");
    CHECK(hits.value()[2].score == Approx(0.3));

    auto limited = idx.lookup({"parse"}, 1);
    REQUIRE(limited.is_ok());
    CHECK(limited.value().size() == 1);
}

TEST_CASE("SymbolIndex replace drops stale definitions", "[symbols]") {
    TempRepo repo("symbols");
    Database db;
    REQUIRE(db.open((repo.root() / "index.db").string()).is_ok());
    SymbolIndex idx(db);
    REQUIRE(idx.open().is_ok());

    REQUIRE(idx.replace("a.py", extract_symbols("a.py", "def old_name():\n    pass\n")).is_ok());
    REQUIRE(idx.replace("a.py", extract_symbols("a.py", "def new_name():\n    pass\n")).is_ok());

    auto syms = idx.symbols_in("a.py");
    REQUIRE(syms.is_ok());
    REQUIRE(syms.value().size() == 1);
    CHECK(syms.value()[0].name == "new_name");

    auto stale = idx.lookup({"old_name"}, 10);
    REQUIRE(stale.is_ok());
    CHECK(stale.value().empty());

    REQUIRE(idx.remove("a.py").is_ok());
    auto none = idx.symbols_in("a.py");
    REQUIRE(none.is_ok());
    CHECK(none.value().empty());
}
