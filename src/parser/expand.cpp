#include "dotenv/parser/expand.hpp"
#include "dotenv/core/logger.hpp"
#include "dotenv/parser/scanner.hpp"

namespace dotenv::parser {

namespace {

/// Length of the variable name starting at `pos`, 0 when there is none.
auto name_length(std::string_view text, std::size_t pos) noexcept -> std::size_t {
    if (pos >= text.size() || !Scanner::is_key_start_char(text[pos])) return 0;

    auto end = pos + 1;
    while (end < text.size() && Scanner::is_key_char(text[end])) {
        ++end;
    }
    return end - pos;
}

/// Append the value of `name`, or `reference` itself when it is not defined.
void resolve(std::string& out, std::string_view reference, std::string_view name,
             const EnvMap& env)
{
    if (auto found = env.find(std::string(name)); found != env.end()) {
        out += found->second;
    } else {
        out += reference;
        LOG_TRACE("Unresolved reference {}", reference);
    }
}

/// Replace every `${NAME}` left to right. Scanning resumes after each
/// reference, so substituted text is not looked at again.
auto substitute_braced(std::string_view input, const EnvMap& env) -> std::string {
    std::string result;
    result.reserve(input.size());

    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '$' && i + 1 < input.size() && input[i + 1] == '{') {
            auto len = name_length(input, i + 2);
            auto close = i + 2 + len;
            if (len > 0 && close < input.size() && input[close] == '}') {
                resolve(result, input.substr(i, close + 1 - i), input.substr(i + 2, len), env);
                i = close + 1;
                continue;
            }
        }
        result += input[i++];
    }
    return result;
}

/// Replace every `$NAME`, taking the longest run of name characters.
auto substitute_bare(std::string_view input, const EnvMap& env) -> std::string {
    std::string result;
    result.reserve(input.size());

    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '$') {
            if (auto len = name_length(input, i + 1); len > 0) {
                resolve(result, input.substr(i, len + 1), input.substr(i + 1, len), env);
                i += len + 1;
                continue;
            }
        }
        result += input[i++];
    }
    return result;
}

} // anonymous namespace

auto expand_variables(std::string_view value, const EnvMap& env) -> std::string {
    auto braced = substitute_braced(value, env);
    return substitute_bare(braced, env);
}

} // namespace dotenv::parser
