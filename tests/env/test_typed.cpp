#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <cstdint>

#include "dotenv/env/typed.hpp"

using namespace std::chrono_literals;
using namespace dotenv::env;

TEST_CASE("typed getters convert present values", "[env][typed]") {
    MapEnvironment env({
        {"NAME", "service"},
        {"DEBUG", "Yes"},
        {"PORT", "8080"},
        {"OFFSET", "-12"},
        {"RATIO", "0.25"},
        {"TIMEOUT", "1m30s"},
        {"HOSTS", "a.example, b.example ,c.example"},
    });

    CHECK(get_string(env, "NAME") == "service");
    CHECK(get_bool(env, "DEBUG") == true);
    CHECK(get_int(env, "OFFSET") == -12);
    CHECK(get_uint<uint16_t>(env, "PORT") == uint16_t{8080});
    CHECK_THAT(*get_float(env, "RATIO"), Catch::Matchers::WithinRel(0.25));
    CHECK(get_duration(env, "TIMEOUT") == 90s);
    CHECK(get_list(env, "HOSTS") ==
          std::vector<std::string>{"a.example", "b.example", "c.example"});
}

TEST_CASE("typed getters report absence", "[env][typed]") {
    MapEnvironment env;

    CHECK_FALSE(get_string(env, "X").has_value());
    CHECK_FALSE(get_bool(env, "X").has_value());
    CHECK_FALSE(get_int(env, "X").has_value());
    CHECK_FALSE(get_duration(env, "X").has_value());
    CHECK_FALSE(get_list(env, "X").has_value());

    CHECK(get_string_or(env, "X", "fallback") == "fallback");
    CHECK(get_bool_or(env, "X", true));
    CHECK(get_int_or(env, "X", 42) == 42);
    CHECK(get_uint_or<uint64_t>(env, "X", 7) == 7u);
    CHECK(get_float_or(env, "X", 1.5) == 1.5);
    CHECK(get_duration_or(env, "X", 5s) == 5s);
}

TEST_CASE("typed getters fall back on unconvertible values", "[env][typed]") {
    MapEnvironment env({
        {"BOOL", "maybe"},
        {"INT", "12abc"},
        {"SMALL", "300"},
        {"UINT", "-1"},
        {"FLOAT", "fast"},
        {"DURATION", "10"},
    });

    CHECK_FALSE(get_bool(env, "BOOL").has_value());
    CHECK(get_bool_or(env, "BOOL", false) == false);

    CHECK_FALSE(get_int(env, "INT").has_value());
    CHECK(get_int_or(env, "INT", 3) == 3);

    CHECK_FALSE(get_int<int8_t>(env, "SMALL").has_value());
    CHECK(get_int<int16_t>(env, "SMALL") == int16_t{300});

    CHECK(get_uint_or(env, "UINT", 9u) == 9u);
    CHECK(get_float_or(env, "FLOAT", 2.0) == 2.0);
    CHECK(get_duration_or(env, "DURATION", 1s) == 1s);
}

TEST_CASE("empty values", "[env][typed]") {
    MapEnvironment env({{"EMPTY", ""}});

    CHECK(get_string_or(env, "EMPTY", "fallback") == "");
    CHECK(get_int_or(env, "EMPTY", 5) == 5);
    CHECK(get_list(env, "EMPTY") == std::vector<std::string>{});
}
