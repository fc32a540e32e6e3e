#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "dotenv/core/error.hpp"
#include "dotenv/export.hpp"

namespace dotenv::parser {

/// Returned by peek()/advance() once the cursor has run past the input.
inline constexpr char kEndOfInput = '\0';

/// Result of scanning an unquoted value.
struct UnquotedValue {
    std::string value;
    bool had_comment = false;  // stopped on '#', which is left unconsumed
};

/// Character cursor over a borrowed .env document.
///
/// Tracks a byte offset plus 1-based line/column of the next unread byte.
/// The cursor never moves backwards. The scanner knows how to read the
/// lexical pieces of an assignment (key, quoted and unquoted values) but
/// not how they combine into a line; that is LineParser's job.
///
/// The input must outlive the scanner.
class DOTENV_API Scanner {
public:
    explicit Scanner(std::string_view input) noexcept : input_(input) {}

    [[nodiscard]] auto peek() const noexcept -> char;
    [[nodiscard]] auto peek_next() const noexcept -> char;

    /// Consume one byte. A line feed bumps the line counter and resets the
    /// column. Returns kEndOfInput without moving at end of input.
    auto advance() noexcept -> char;

    /// Skip spaces and tabs. Newlines are significant and left alone.
    void skip_whitespace() noexcept;

    /// Consume through the next line feed, or to end of input.
    void skip_to_next_line() noexcept;

    /// Consume `literal` if the remaining input starts with it.
    auto consume_prefix(std::string_view literal) noexcept -> bool;

    /// Read a variable name: [A-Za-z_][A-Za-z0-9_]*.
    /// Fails with InvalidKey when the first byte cannot start a name.
    auto parse_key() -> Result<std::string>;

    /// Read up to LF, CR or '#', then drop trailing spaces and tabs.
    auto parse_unquoted_value() -> UnquotedValue;

    /// Read a value enclosed in `quote` (either ' or "), cursor on the
    /// opening quote. Backslash escapes are decoded inside double quotes
    /// only. Fails with UnterminatedString, reporting the line the value
    /// started on, if the closing quote is missing.
    auto parse_quoted_value(char quote) -> Result<std::string>;

    [[nodiscard]] static auto is_key_start_char(char c) noexcept -> bool;
    [[nodiscard]] static auto is_key_char(char c) noexcept -> bool;

    [[nodiscard]] auto at_end() const noexcept -> bool { return pos_ >= input_.size(); }
    [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }
    [[nodiscard]] auto line() const noexcept -> std::size_t { return line_; }
    [[nodiscard]] auto column() const noexcept -> std::size_t { return column_; }
    [[nodiscard]] auto remaining() const noexcept -> std::string_view {
        return at_end() ? std::string_view{} : input_.substr(pos_);
    }

private:
    std::string_view input_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
};

} // namespace dotenv::parser
