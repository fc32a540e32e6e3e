#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "dotenv/env/environment.hpp"

using dotenv::EnvMap;
using dotenv::ErrorCode;
using namespace dotenv::env;

namespace {

/// Accepts a fixed number of writes, then fails every one after that.
class FailingEnvironment : public MapEnvironment {
public:
    explicit FailingEnvironment(int allowed) : allowed_(allowed) {}

    auto set(std::string_view key, std::string_view value) -> dotenv::VoidResult override {
        if (allowed_-- <= 0) {
            return std::unexpected(dotenv::make_error(ErrorCode::EnvironmentError,
                                                      "store is full", std::string(key)));
        }
        return MapEnvironment::set(key, value);
    }

private:
    int allowed_;
};

} // anonymous namespace

TEST_CASE("is_valid_name", "[env]") {
    CHECK(is_valid_name("PATH"));
    CHECK(is_valid_name("lower.case-ok"));
    CHECK_FALSE(is_valid_name(""));
    CHECK_FALSE(is_valid_name("A=B"));
    CHECK_FALSE(is_valid_name(std::string_view("A\0B", 3)));
}

TEST_CASE("MapEnvironment get/set/unset", "[env]") {
    MapEnvironment env({{"EXISTING", "1"}});

    CHECK(env.get("EXISTING") == "1");
    CHECK(env.has("EXISTING"));
    CHECK_FALSE(env.get("MISSING").has_value());

    REQUIRE(env.set("NEW", "value").has_value());
    CHECK(env.get("NEW") == "value");

    REQUIRE(env.set("NEW", "").has_value());
    CHECK(env.get("NEW") == "");
    CHECK(env.has("NEW"));

    REQUIRE(env.unset("NEW").has_value());
    CHECK_FALSE(env.has("NEW"));

    SECTION("invalid names are rejected") {
        auto result = env.set("BAD=NAME", "x");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::EnvironmentError);
        CHECK(env.snapshot().size() == 1);
    }
}

TEST_CASE("ProcessEnvironment reads and writes the process environment", "[env]") {
    ProcessEnvironment env;
    const char* key = "DOTENV_TEST_PROCESS_VAR";

    REQUIRE(env.set(key, "from test").has_value());
    REQUIRE(std::getenv(key) != nullptr);
    CHECK(std::string(std::getenv(key)) == "from test");
    CHECK(env.get(key) == "from test");

    REQUIRE(env.unset(key).has_value());
    CHECK(std::getenv(key) == nullptr);
    CHECK_FALSE(env.has(key));

    auto bad = env.set("", "x");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::EnvironmentError);
}

TEST_CASE("apply copies variables into the target", "[env][apply]") {
    EnvMap vars{{"A", "1"}, {"B", "2"}, {"C", "3"}};

    SECTION("overwrite replaces existing values") {
        MapEnvironment target({{"B", "old"}});
        REQUIRE(apply(vars, target).has_value());
        CHECK(target.snapshot() == vars);
    }

    SECTION("without overwrite existing values win") {
        MapEnvironment target({{"B", "old"}});
        REQUIRE(apply(vars, target, false).has_value());
        CHECK(target.get("A") == "1");
        CHECK(target.get("B") == "old");
        CHECK(target.get("C") == "3");
    }

    SECTION("an existing empty value counts as set") {
        MapEnvironment target({{"B", ""}});
        REQUIRE(apply(vars, target, false).has_value());
        CHECK(target.get("B") == "");
    }

    SECTION("stops at the first failure") {
        FailingEnvironment target(1);
        auto result = apply(vars, target);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::EnvironmentError);
        CHECK(result.error().detail() == "B");
        CHECK(target.get("A") == "1");
        CHECK_FALSE(target.has("C"));
    }

    SECTION("empty input is a no-op") {
        MapEnvironment target;
        REQUIRE(apply({}, target).has_value());
        CHECK(target.snapshot().empty());
    }
}

TEST_CASE("with_prefix renames keys", "[env]") {
    EnvMap vars{{"HOST", "h"}, {"PORT", "1"}};

    auto prefixed = with_prefix(vars, "APP_");
    CHECK(prefixed == EnvMap{{"APP_HOST", "h"}, {"APP_PORT", "1"}});

    CHECK(with_prefix(vars, "") == vars);
}
