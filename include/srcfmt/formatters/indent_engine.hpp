#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace srcfmt::indent_engine {

struct IndentOptions {
    bool use_tabs = false;
    int tab_size = 4;
    int blank_lines_to_preserve = 1;
    // Delimiter of literals that may span lines ("\"\"\"" for Java text blocks, "`" for
    // JavaScript template literals); empty disables them
    std::string multiline_literal;
};

// Split on CRLF, LF or CR. A trailing separator does not produce an empty last line.
auto split_lines(std::string_view text) -> std::vector<std::string>;

// Every line is terminated by the separator
auto join_lines(const std::vector<std::string>& lines, std::string_view separator) -> std::string;

// Recompute indentation from brace nesting. Throws FormatError on unbalanced braces and
// unterminated literals or comments.
auto reindent(const std::vector<std::string>& lines, const IndentOptions& options)
    -> std::vector<std::string>;

// The same lines with literal contents and comments blanked out, so callers can search
// for language constructs. Throws FormatError like reindent.
auto code_view(const std::vector<std::string>& lines, const IndentOptions& options)
    -> std::vector<std::string>;

} // namespace srcfmt::indent_engine
