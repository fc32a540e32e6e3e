#include <catch2/catch_test_macros.hpp>

#include "dotenv/core/utils.hpp"

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(dotenv::utils::trim("  hello  ") == "hello");
    }

    SECTION("leading and trailing tabs and newlines") {
        REQUIRE(dotenv::utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("no whitespace") {
        REQUIRE(dotenv::utils::trim("hello") == "hello");
    }

    SECTION("empty string") {
        REQUIRE(dotenv::utils::trim("") == "");
    }

    SECTION("only whitespace") {
        REQUIRE(dotenv::utils::trim("   \t\n  ") == "");
    }

    SECTION("internal whitespace preserved") {
        REQUIRE(dotenv::utils::trim("  hello world  ") == "hello world");
    }
}

TEST_CASE("split divides string by delimiter", "[utils]") {
    SECTION("basic split on comma") {
        auto parts = dotenv::utils::split("a,b,c", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "a");
        CHECK(parts[1] == "b");
        CHECK(parts[2] == "c");
    }

    SECTION("no delimiter present") {
        auto parts = dotenv::utils::split("hello", ',');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0] == "hello");
    }

    SECTION("trailing delimiter keeps an empty last part") {
        auto parts = dotenv::utils::split("a,b,", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[2] == "");
    }

    SECTION("empty string is one empty part") {
        auto parts = dotenv::utils::split("", ',');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0] == "");
    }

    SECTION("consecutive delimiters") {
        auto parts = dotenv::utils::split("a,,b", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "a");
        CHECK(parts[1] == "");
        CHECK(parts[2] == "b");
    }
}

TEST_CASE("join concatenates with separator", "[utils]") {
    CHECK(dotenv::utils::join({"a", "b", "c"}, ", ") == "a, b, c");
    CHECK(dotenv::utils::join({"only"}, ",") == "only");
    CHECK(dotenv::utils::join({}, ",") == "");
}

TEST_CASE("to_lower", "[utils]") {
    CHECK(dotenv::utils::to_lower("HELLO") == "hello");
    CHECK(dotenv::utils::to_lower("Hello World") == "hello world");
    CHECK(dotenv::utils::to_lower("already") == "already");
    CHECK(dotenv::utils::to_lower("") == "");
}

TEST_CASE("starts_with", "[utils]") {
    CHECK(dotenv::utils::starts_with("export KEY", "export"));
    CHECK_FALSE(dotenv::utils::starts_with("KEY", "export"));
    CHECK(dotenv::utils::starts_with("", ""));
    CHECK_FALSE(dotenv::utils::starts_with("", "a"));
}
