#include "dotenv/parser/scanner.hpp"

namespace dotenv::parser {

auto Scanner::peek() const noexcept -> char {
    if (pos_ >= input_.size()) return kEndOfInput;
    return input_[pos_];
}

auto Scanner::peek_next() const noexcept -> char {
    if (pos_ + 1 >= input_.size()) return kEndOfInput;
    return input_[pos_ + 1];
}

auto Scanner::advance() noexcept -> char {
    if (pos_ >= input_.size()) return kEndOfInput;

    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void Scanner::skip_whitespace() noexcept {
    while (!at_end() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

void Scanner::skip_to_next_line() noexcept {
    while (!at_end() && peek() != '\n') {
        advance();
    }
    if (!at_end()) {
        advance();  // the '\n' itself
    }
}

auto Scanner::consume_prefix(std::string_view literal) noexcept -> bool {
    if (!remaining().starts_with(literal)) return false;
    for (std::size_t i = 0; i < literal.size(); ++i) {
        advance();
    }
    return true;
}

auto Scanner::is_key_start_char(char c) noexcept -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

auto Scanner::is_key_char(char c) noexcept -> bool {
    return is_key_start_char(c) || (c >= '0' && c <= '9');
}

auto Scanner::parse_key() -> Result<std::string> {
    if (!is_key_start_char(peek())) {
        return std::unexpected(make_parse_error(
            ErrorCode::InvalidKey,
            "invalid key name: keys must start with a letter or underscore",
            line_));
    }

    auto start = pos_;
    while (!at_end() && is_key_char(peek())) {
        advance();
    }
    return std::string(input_.substr(start, pos_ - start));
}

auto Scanner::parse_unquoted_value() -> UnquotedValue {
    UnquotedValue result;

    while (!at_end()) {
        char c = peek();
        if (c == '\n' || c == '\r') {
            break;
        }
        if (c == '#') {
            result.had_comment = true;
            break;
        }
        result.value += advance();
    }

    // Trailing blanks only; interior whitespace is part of the value.
    auto end = result.value.find_last_not_of(" \t");
    result.value.erase(end == std::string::npos ? 0 : end + 1);
    return result;
}

auto Scanner::parse_quoted_value(char quote) -> Result<std::string> {
    const auto start_line = line_;
    std::string value;

    advance();  // opening quote

    while (!at_end()) {
        char c = peek();

        if (c == quote) {
            advance();
            return value;
        }

        if (c == '\\' && quote == '"') {
            advance();
            if (at_end()) {
                return std::unexpected(make_parse_error(
                    ErrorCode::UnterminatedString,
                    "unexpected end of input after escape in quoted string",
                    start_line));
            }

            char escaped = advance();
            switch (escaped) {
                case 'n':  value += '\n'; break;
                case 't':  value += '\t'; break;
                case 'r':  value += '\r'; break;
                case '\\': value += '\\'; break;
                case '"':  value += '"';  break;
                case '\'': value += '\''; break;
                default:
                    value += '\\';
                    value += escaped;
                    break;
            }
            continue;
        }

        value += advance();
    }

    return std::unexpected(make_parse_error(
        ErrorCode::UnterminatedString,
        "unterminated quoted string",
        start_line));
}

} // namespace dotenv::parser
