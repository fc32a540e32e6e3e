#include "dotenv/parser/line_parser.hpp"
#include "dotenv/core/logger.hpp"
#include "dotenv/parser/expand.hpp"

namespace dotenv::parser {

namespace {

constexpr std::string_view kExportKeyword = "export ";

} // anonymous namespace

auto LineParser::parse_line() -> Result<ParsedLine> {
    scanner_.skip_whitespace();

    // Blank line or full-line comment.
    char first = scanner_.peek();
    if (scanner_.at_end() || first == '\n' || first == '\r' || first == '#') {
        scanner_.skip_to_next_line();
        return ParsedLine{};
    }

    if (options_.allow_export && scanner_.consume_prefix(kExportKeyword)) {
        scanner_.skip_whitespace();
    }

    auto key = scanner_.parse_key();
    if (!key) return std::unexpected(key.error());
    if (key->empty()) {
        return std::unexpected(make_parse_error(
            ErrorCode::MissingVariableName,
            "expected variable name",
            scanner_.line()));
    }

    scanner_.skip_whitespace();
    if (scanner_.peek() != '=') {
        return std::unexpected(make_parse_error(
            ErrorCode::MissingAssignment,
            "expected '=' after variable name '" + *key + "'",
            scanner_.line()));
    }
    scanner_.advance();
    scanner_.skip_whitespace();

    ParsedLine parsed;
    parsed.key = std::move(*key);

    switch (scanner_.peek()) {
        case '"': {
            auto value = scanner_.parse_quoted_value('"');
            if (!value) return std::unexpected(value.error());
            parsed.value = std::move(*value);
            parsed.allow_expansion = true;
            parsed.quote = QuoteContext::DoubleQuoted;
            break;
        }
        case '\'': {
            auto value = scanner_.parse_quoted_value('\'');
            if (!value) return std::unexpected(value.error());
            parsed.value = std::move(*value);
            parsed.allow_expansion = false;
            parsed.quote = QuoteContext::SingleQuoted;
            break;
        }
        default: {
            auto unquoted = scanner_.parse_unquoted_value();
            parsed.value = std::move(unquoted.value);
            parsed.allow_expansion = true;
            parsed.quote = QuoteContext::Unquoted;
            if (unquoted.had_comment) {
                scanner_.skip_to_next_line();
            }
            break;
        }
    }

    // Comment after a quoted value.
    scanner_.skip_whitespace();
    if (!scanner_.at_end() && scanner_.peek() == '#') {
        scanner_.skip_to_next_line();
    }

    return parsed;
}

auto LineParser::parse() -> Result<EnvMap> {
    EnvMap env;

    while (!scanner_.at_end()) {
        auto parsed = parse_line();
        if (!parsed) {
            LOG_DEBUG("Parse failed: {}", parsed.error().what());
            return std::unexpected(parsed.error());
        }
        if (parsed->is_blank()) {
            continue;
        }

        // Only keys from earlier lines are visible to the expansion.
        auto& value = parsed->value;
        if (options_.expand && parsed->allow_expansion &&
            value.find('$') != std::string::npos) {
            value = expand_variables(value, env);
        }

        env.insert_or_assign(std::move(parsed->key), std::move(value));
    }

    LOG_DEBUG("Parsed {} variables over {} lines", env.size(), scanner_.line());
    return env;
}

auto parse(std::string_view text, ParserOptions options) -> Result<EnvMap> {
    LineParser parser(text, options);
    return parser.parse();
}

} // namespace dotenv::parser
