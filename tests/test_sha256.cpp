#include <catch2/catch.hpp>
#include <sift/sha256.hpp>
#include "support/temp_repo.hpp"

using namespace sift;

TEST_CASE("SHA256 empty string", "[sha256]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 'abc' (NIST vector)", "[sha256]") {
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 448-bit message (NIST vector)", "[sha256]") {
    REQUIRE(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA256 incremental update matches one-shot", "[sha256]") {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    Sha256 ctx;
    for (char c : msg) ctx.update(&c, 1);
    REQUIRE(ctx.hex_digest() == sha256_hex(msg));
}

TEST_CASE("SHA256 of a file matches the in-memory digest", "[sha256]") {
    sift_test::TempRepo repo("sha");
    std::string content(50000, 'x');
    repo.write("big.txt", content);

    auto r = sha256_file(repo.path("big.txt"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == sha256_hex(content));
}

TEST_CASE("SHA256 of a missing file is an IO error", "[sha256]") {
    auto r = sha256_file("/nonexistent/sift/file");
    REQUIRE(r.is_err());
    CHECK(r.error().code == SiftError::IO);
}

TEST_CASE("Fingerprint ignores insertion order", "[sha256]") {
    std::map<std::string, std::string> a;
    a["b.py::off0"] = "h2";
    a["a.py::off0"] = "h1";
    std::map<std::string, std::string> b;
    b["a.py::off0"] = "h1";
    b["b.py::off0"] = "h2";
    REQUIRE(fingerprint(a) == fingerprint(b));

    b["b.py::off0"] = "h3";
    REQUIRE(fingerprint(a) != fingerprint(b));
}
