#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace tooledchat;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: empty string returns empty", "[util]") {
    REQUIRE(trim("").empty());
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

TEST_CASE("trim: inner whitespace kept", "[util]") {
    REQUIRE(trim(" a \n b ") == "a \n b");
}

// ── iequals ──────────────────────────────────────────────────────

TEST_CASE("iequals: ignores ASCII case", "[util]") {
    REQUIRE(iequals("TRUE", "true"));
    REQUIRE(iequals("False", "fAlSe"));
    REQUIRE_FALSE(iequals("true", "truth"));
    REQUIRE_FALSE(iequals("true", "tru"));
    REQUIRE(iequals("", ""));
}

// ── format_placeholders ──────────────────────────────────────────

TEST_CASE("format_placeholders: substitutes known keys", "[util]") {
    REQUIRE(format_placeholders("{name}: {description}",
                                {{"name", "weather"}, {"description", "Forecasts"}}) ==
            "weather: Forecasts");
}

TEST_CASE("format_placeholders: repeated and unknown keys", "[util]") {
    REQUIRE(format_placeholders("{a}{a} {b}", {{"a", "x"}}) == "xx {b}");
}

TEST_CASE("format_placeholders: substituted text is not re-expanded", "[util]") {
    REQUIRE(format_placeholders("Error: {error}", {{"error", "bad {error} value"}}) ==
            "Error: bad {error} value");
}

TEST_CASE("format_placeholders: JSON braces survive", "[util]") {
    REQUIRE(format_placeholders("Parameters: {params}", {{"params", "{\"x\": {}}"}}) ==
            "Parameters: {\"x\": {}}");
    REQUIRE(format_placeholders("{ not a key", {}) == "{ not a key");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/Documents");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/Documents").size());
}

TEST_CASE("expand_home: empty string unchanged", "[util]") {
    REQUIRE(expand_home("").empty());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories", "[util]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("tooledchat_util_" + std::to_string(getpid()));
    std::filesystem::remove_all(dir);
    auto path = (dir / "nested" / "file.txt").string();

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "second");

    std::filesystem::remove_all(dir);
}

TEST_CASE("epoch_seconds: plausible clock", "[util]") {
    // 2020-01-01
    REQUIRE(epoch_seconds() > 1577836800ULL);
}
