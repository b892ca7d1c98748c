#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include "http.hpp"

using namespace termai;

TEST_CASE("trim: removes surrounding whitespace", "[util]") {
    REQUIRE(trim("  hi \n") == "hi");
    REQUIRE(trim("") == "");
    REQUIRE(trim(" \t\n ") == "");
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("DuckDuckGo") == "duckduckgo");
}

TEST_CASE("join: separator between parts", "[util]") {
    REQUIRE(join({"a", "b", "c"}, ", ") == "a, b, c");
    REQUIRE(join({}, ", ").empty());
    REQUIRE(join({"solo"}, ", ") == "solo");
}

TEST_CASE("truncate_text: short text unchanged", "[util]") {
    REQUIRE(truncate_text("abc", 3) == "abc");
    REQUIRE(truncate_text("abcd", 3) == "abc...");
}

TEST_CASE("truncate_text: does not split UTF-8 sequences", "[util]") {
    std::string s = "ab\xc3\xa9z"; // "abéz"
    REQUIRE(truncate_text(s, 3) == "ab...");
}

TEST_CASE("strip_trailing_slashes: base URLs", "[util]") {
    REQUIRE(strip_trailing_slashes("http://h:1//") == "http://h:1");
    REQUIRE(strip_trailing_slashes("http://h:1") == "http://h:1");
}

TEST_CASE("generate_id: 16 hex chars, distinct", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a != b);
}

TEST_CASE("url_encode: reserved characters are escaped", "[util]") {
    REQUIRE(url_encode("a b&c=d") == "a%20b%26c%3Dd");
    REQUIRE(url_encode("rust-1.93_x~") == "rust-1.93_x~");
}
