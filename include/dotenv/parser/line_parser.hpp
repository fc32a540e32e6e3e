#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "dotenv/core/error.hpp"
#include "dotenv/core/types.hpp"
#include "dotenv/export.hpp"
#include "dotenv/parser/scanner.hpp"

namespace dotenv::parser {

/// How a value was written. Governs escapes and expansion.
enum class QuoteContext {
    Unquoted,
    SingleQuoted,
    DoubleQuoted,
};

/// One logical line. An empty key means a blank or comment line that the
/// caller skips.
struct ParsedLine {
    std::string key;
    std::string value;
    bool allow_expansion = false;
    QuoteContext quote = QuoteContext::Unquoted;

    [[nodiscard]] auto is_blank() const noexcept -> bool { return key.empty(); }
};

struct ParserOptions {
    bool allow_export = true;  // accept a leading "export " keyword
    bool expand = true;        // substitute $NAME / ${NAME} references
};

/// Parses a .env document one logical line at a time.
///
/// Grammar per line:
///   [ws] [export ws] KEY [ws] = [ws] VALUE [ws] [# comment] EOL
/// where VALUE is "double quoted", 'single quoted' or unquoted text up to
/// the first '#' or end of line. Blank and comment-only lines produce a
/// blank ParsedLine.
class DOTENV_API LineParser {
public:
    explicit LineParser(std::string_view input, ParserOptions options = {}) noexcept
        : scanner_(input), options_(options) {}

    /// Parse the next logical line. A trailing comment is consumed with the
    /// line; otherwise the cursor stops on the line break after the value
    /// and the next call returns it as a blank line.
    auto parse_line() -> Result<ParsedLine>;

    /// Parse the remaining input. The first error aborts the whole
    /// document; no partial map is returned.
    auto parse() -> Result<EnvMap>;

    [[nodiscard]] auto at_end() const noexcept -> bool { return scanner_.at_end(); }
    [[nodiscard]] auto line() const noexcept -> std::size_t { return scanner_.line(); }

private:
    Scanner scanner_;
    ParserOptions options_;
};

/// Parse a complete .env document into a variable map.
DOTENV_API auto parse(std::string_view text, ParserOptions options = {}) -> Result<EnvMap>;

} // namespace dotenv::parser
