#include <catch2/catch_test_macros.hpp>

#include "dotenv/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        dotenv::Error err(dotenv::ErrorCode::NotFound, "variable not found");
        CHECK(err.code() == dotenv::ErrorCode::NotFound);
        CHECK(err.message() == "variable not found");
        CHECK(err.detail() == "");
        CHECK(err.line() == 0);
        CHECK(err.what() == "variable not found");
    }

    SECTION("error with detail") {
        dotenv::Error err(dotenv::ErrorCode::IoError,
                          "failed to read file", "/etc/app/.env");
        CHECK(err.code() == dotenv::ErrorCode::IoError);
        CHECK(err.message() == "failed to read file");
        CHECK(err.detail() == "/etc/app/.env");
        CHECK(err.what() == "failed to read file: /etc/app/.env");
    }

    SECTION("error with line") {
        dotenv::Error err(dotenv::ErrorCode::UnterminatedString,
                          "unterminated quoted value", std::size_t{7});
        CHECK(err.line() == 7);
        CHECK(err.detail() == "");
        CHECK(err.what() == "line 7: unterminated quoted value");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = dotenv::make_error(dotenv::ErrorCode::InvalidArgument, "empty key");
        CHECK(err.code() == dotenv::ErrorCode::InvalidArgument);
        CHECK(err.message() == "empty key");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = dotenv::make_error(dotenv::ErrorCode::ConversionFailed,
                                      "invalid integer", "\"abc\"");
        CHECK(err.code() == dotenv::ErrorCode::ConversionFailed);
        CHECK(err.what() == "invalid integer: \"abc\"");
    }

    SECTION("parse error form") {
        auto err = dotenv::make_parse_error(dotenv::ErrorCode::InvalidKey,
                                            "invalid variable name", 3);
        CHECK(err.code() == dotenv::ErrorCode::InvalidKey);
        CHECK(err.line() == 3);
        CHECK(err.what() == "line 3: invalid variable name");
    }
}

TEST_CASE("Result type success case", "[error]") {
    dotenv::Result<int> result = 42;

    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("Result type error case", "[error]") {
    dotenv::Result<int> result = std::unexpected(
        dotenv::make_error(dotenv::ErrorCode::InvalidArgument, "bad value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == dotenv::ErrorCode::InvalidArgument);
    CHECK(result.error().message() == "bad value");
}

TEST_CASE("VoidResult success and error", "[error]") {
    SECTION("success") {
        dotenv::VoidResult result{};
        REQUIRE(result.has_value());
    }

    SECTION("error") {
        dotenv::VoidResult result = std::unexpected(
            dotenv::make_error(dotenv::ErrorCode::EnvironmentError, "setenv failed"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == dotenv::ErrorCode::EnvironmentError);
    }
}

TEST_CASE("is_parse_error classifies grammar errors", "[error]") {
    CHECK(dotenv::is_parse_error(dotenv::ErrorCode::InvalidKey));
    CHECK(dotenv::is_parse_error(dotenv::ErrorCode::MissingVariableName));
    CHECK(dotenv::is_parse_error(dotenv::ErrorCode::MissingAssignment));
    CHECK(dotenv::is_parse_error(dotenv::ErrorCode::UnterminatedString));

    CHECK_FALSE(dotenv::is_parse_error(dotenv::ErrorCode::IoError));
    CHECK_FALSE(dotenv::is_parse_error(dotenv::ErrorCode::ConversionFailed));
    CHECK_FALSE(dotenv::is_parse_error(dotenv::ErrorCode::Unknown));
}

TEST_CASE("error_code_to_string names every code", "[error]") {
    CHECK(dotenv::error_code_to_string(dotenv::ErrorCode::InvalidKey) == "INVALID_KEY");
    CHECK(dotenv::error_code_to_string(dotenv::ErrorCode::MissingVariableName) ==
          "MISSING_VARIABLE_NAME");
    CHECK(dotenv::error_code_to_string(dotenv::ErrorCode::MissingAssignment) ==
          "MISSING_ASSIGNMENT");
    CHECK(dotenv::error_code_to_string(dotenv::ErrorCode::UnterminatedString) ==
          "UNTERMINATED_STRING");
    CHECK(dotenv::error_code_to_string(dotenv::ErrorCode::RequiredMissing) ==
          "REQUIRED_MISSING");
    CHECK(dotenv::error_code_to_string(dotenv::ErrorCode::Unknown) == "UNKNOWN");
}
