#include "srcfmt/formatters/javascript_formatter.hpp"

namespace srcfmt {

auto JavaScriptFormatter::configure([[maybe_unused]] const FormatterOptions& options) -> void {
    indent_options_.multiline_literal = "`";
}

auto JavaScriptFormatter::do_format(const std::string& code, const std::string& line_separator)
    -> std::string {
    auto lines = indent_engine::split_lines(code);
    return indent_engine::join_lines(indent_engine::reindent(lines, indent_options_), line_separator);
}

} // namespace srcfmt
