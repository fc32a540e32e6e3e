#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "dotenv/io/loader.hpp"
#include "dotenv/io/writer.hpp"
#include "dotenv/parser/line_parser.hpp"

namespace fs = std::filesystem;
using dotenv::EnvMap;

TEST_CASE("needs_quoting detects special characters", "[io][writer]") {
    CHECK_FALSE(dotenv::io::needs_quoting(""));
    CHECK_FALSE(dotenv::io::needs_quoting("plain"));
    CHECK_FALSE(dotenv::io::needs_quoting("a=b,c:d/e"));

    CHECK(dotenv::io::needs_quoting("has space"));
    CHECK(dotenv::io::needs_quoting("tab\there"));
    CHECK(dotenv::io::needs_quoting("line\nbreak"));
    CHECK(dotenv::io::needs_quoting("cr\r"));
    CHECK(dotenv::io::needs_quoting("say\"hi\""));
    CHECK(dotenv::io::needs_quoting("it's"));
    CHECK(dotenv::io::needs_quoting("C:\\path"));
    CHECK(dotenv::io::needs_quoting("#hash"));
    CHECK(dotenv::io::needs_quoting("$VAR"));
}

TEST_CASE("quote_value escapes control characters", "[io][writer]") {
    CHECK(dotenv::io::quote_value("a b") == "\"a b\"");
    CHECK(dotenv::io::quote_value("a\\b") == R"("a\\b")");
    CHECK(dotenv::io::quote_value("say \"hi\"") == R"("say \"hi\"")");
    CHECK(dotenv::io::quote_value("l1\nl2\tx\ry") == R"("l1\nl2\tx\ry")");
}

TEST_CASE("serialize writes sorted KEY=value lines", "[io][writer]") {
    EnvMap vars{{"ZED", "last"}, {"ALPHA", "first"}, {"MSG", "hello world"}, {"EMPTY", ""}};

    CHECK(dotenv::io::serialize(vars) ==
          "ALPHA=first\n"
          "EMPTY=\n"
          "MSG=\"hello world\"\n"
          "ZED=last\n");

    CHECK(dotenv::io::serialize({}).empty());
}

TEST_CASE("serialize single-quotes values with references", "[io][writer]") {
    CHECK(dotenv::io::render_value("$HOME/bin") == "'$HOME/bin'");
    CHECK(dotenv::io::render_value("it's $5") == R"("it's $5")");
}

TEST_CASE("serialize output parses back to the same map", "[io][writer]") {
    EnvMap vars{
        {"PLAIN", "value"},
        {"SPACES", "  padded  "},
        {"QUOTES", R"(she said "hi" and 'bye')"},
        {"BACKSLASH", R"(C:\Users\name)"},
        {"HASH", "value # not a comment"},
        {"REF", "${PLAIN} and $PLAIN"},
        {"CONTROL", "a\nb\tc\rd"},
        {"EMPTY", ""},
        {"URL", "postgres://user:pw@host:5432/db?x=1"},
    };

    auto parsed = dotenv::parser::parse(dotenv::io::serialize(vars));
    REQUIRE(parsed.has_value());
    CHECK(*parsed == vars);
}

TEST_CASE("write_file creates a loadable file", "[io][writer]") {
    auto path = fs::temp_directory_path() / "test_dotenv_written.env";
    EnvMap vars{{"A", "1"}, {"B", "two words"}};

    auto written = dotenv::io::write_file(path, vars);
    REQUIRE(written.has_value());

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    CHECK(contents.str() == "A=1\nB=\"two words\"\n");

    auto loaded = dotenv::io::load(path);
    REQUIRE(loaded.has_value());
    CHECK(*loaded == vars);

    fs::remove(path);
}

TEST_CASE("write_file reports unwritable paths", "[io][writer]") {
    auto result = dotenv::io::write_file("/nonexistent/dir/out.env", {{"A", "1"}});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == dotenv::ErrorCode::IoError);
}
