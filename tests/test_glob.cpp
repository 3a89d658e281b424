#include <catch2/catch.hpp>
#include <bmr/glob.hpp>

using namespace bmr;

// ---- Literal matching ----

TEST_CASE("glob literal exact match", "[glob]") {
    REQUIRE(glob_match("node_modules", "node_modules"));
    REQUIRE_FALSE(glob_match("node_modules", "node_module"));
}

TEST_CASE("glob literal case sensitivity", "[glob]") {
    REQUIRE_FALSE(glob_match("Build", "build"));
}

TEST_CASE("glob dot names match literally", "[glob]") {
    REQUIRE(glob_match(".git", ".git"));
    REQUIRE_FALSE(glob_match(".git", "git"));
}

// ---- Wildcards ----

TEST_CASE("glob star", "[glob]") {
    REQUIRE(glob_match("*.bak", "agents.bak"));
    REQUIRE(glob_match("tmp*", "tmp"));
    REQUIRE(glob_match("tmp*", "tmp-2024"));
    REQUIRE_FALSE(glob_match("tmp*", "atmp"));
}

TEST_CASE("glob star in middle of name", "[glob]") {
    REQUIRE(glob_match("test_*_data", "test_big_data"));
    REQUIRE_FALSE(glob_match("test_*_data", "test_big_datas"));
}

TEST_CASE("glob star backtracking", "[glob]") {
    REQUIRE(glob_match("*a*b", "xaayb"));
    REQUIRE_FALSE(glob_match("*a*b", "xaayc"));
}

TEST_CASE("glob question mark single char", "[glob]") {
    REQUIRE(glob_match("dist?", "dist2"));
    REQUIRE_FALSE(glob_match("dist?", "dist"));
    REQUIRE_FALSE(glob_match("dist?", "dist12"));
}

// ---- Character classes ----

TEST_CASE("glob character class", "[glob]") {
    REQUIRE(glob_match("build[0-9]", "build7"));
    REQUIRE_FALSE(glob_match("build[0-9]", "buildx"));
    REQUIRE(glob_match("[bc]ache", "cache"));
}

TEST_CASE("glob negated class", "[glob]") {
    REQUIRE(glob_match("out[!0-9]", "outx"));
    REQUIRE_FALSE(glob_match("out[!0-9]", "out3"));
}

TEST_CASE("glob unterminated class is literal", "[glob]") {
    REQUIRE(glob_match("a[b", "a[b"));
    REQUIRE_FALSE(glob_match("a[b", "ab"));
}

// ---- Pattern lists ----

TEST_CASE("glob_match_any", "[glob]") {
    std::vector<std::string> patterns{".git", "node_modules", "build*"};
    REQUIRE(glob_match_any(patterns, ".git"));
    REQUIRE(glob_match_any(patterns, "build-debug"));
    REQUIRE_FALSE(glob_match_any(patterns, "bmad"));
    REQUIRE_FALSE(glob_match_any({}, "anything"));
}
