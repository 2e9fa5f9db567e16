#include "srcfmt/formatters/indent_engine.hpp"
#include "srcfmt/core/string_utils.hpp"
#include "srcfmt/errors.hpp"
#include <algorithm>

namespace srcfmt::indent_engine {

namespace {

enum class Region {
    CODE,
    STRING,            // '...' or "..." on a single line
    BLOCK_COMMENT,
    MULTILINE_LITERAL  // text block or template literal
};

struct ScanState {
    Region region = Region::CODE;
    char quote = '\0';
    int depth = 0;
};

// Walks one line, calling on_code(index) for every character that is neither literal
// content nor comment. Literal delimiters themselves count as non-code.
template<typename OnCode>
auto scan_line(std::string_view line, ScanState& state, const IndentOptions& options,
               size_t line_number, OnCode&& on_code) -> void {
    const std::string& delimiter = options.multiline_literal;

    size_t i = 0;
    while (i < line.size()) {
        char c = line[i];
        switch (state.region) {
        case Region::CODE:
            if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') {
                return; // Rest of line is a comment
            }
            if (c == '/' && i + 1 < line.size() && line[i + 1] == '*') {
                state.region = Region::BLOCK_COMMENT;
                i += 2;
                continue;
            }
            if (!delimiter.empty() && line.substr(i, delimiter.size()) == delimiter) {
                state.region = Region::MULTILINE_LITERAL;
                i += delimiter.size();
                continue;
            }
            if (c == '"' || c == '\'') {
                state.region = Region::STRING;
                state.quote = c;
                ++i;
                continue;
            }
            on_code(i);
            ++i;
            break;

        case Region::STRING:
            if (c == '\\') {
                i += 2;
                continue;
            }
            if (c == state.quote) {
                state.region = Region::CODE;
            }
            ++i;
            break;

        case Region::BLOCK_COMMENT:
            if (c == '*' && i + 1 < line.size() && line[i + 1] == '/') {
                state.region = Region::CODE;
                i += 2;
                continue;
            }
            ++i;
            break;

        case Region::MULTILINE_LITERAL:
            if (c == '\\') {
                i += 2;
                continue;
            }
            if (line.substr(i, delimiter.size()) == delimiter) {
                state.region = Region::CODE;
                i += delimiter.size();
                continue;
            }
            ++i;
            break;
        }
    }

    if (state.region == Region::STRING) {
        throw FormatError("Unterminated string literal at line " + std::to_string(line_number));
    }
}

auto brace_counter(std::string_view text, ScanState& state, size_t line_number) {
    return [text, &state, line_number](size_t i) {
        if (text[i] == '{') {
            state.depth++;
        } else if (text[i] == '}') {
            if (--state.depth < 0) {
                throw FormatError("Unmatched closing brace at line " + std::to_string(line_number));
            }
        }
    };
}

auto indentation(int level, const IndentOptions& options) -> std::string {
    if (level <= 0) {
        return "";
    }
    if (options.use_tabs) {
        return std::string(static_cast<size_t>(level), '\t');
    }
    return std::string(static_cast<size_t>(level * options.tab_size), ' ');
}

auto count_leading_closers(std::string_view trimmed) -> int {
    int count = 0;
    for (char c : trimmed) {
        if (c == '}') {
            count++;
        } else if (c != ' ' && c != '\t') {
            break;
        }
    }
    return count;
}

auto check_end_of_input(const ScanState& state) -> void {
    if (state.region == Region::BLOCK_COMMENT) {
        throw FormatError("Unterminated block comment at end of input");
    }
    if (state.region == Region::MULTILINE_LITERAL) {
        throw FormatError("Unterminated multi-line literal at end of input");
    }
    if (state.depth != 0) {
        throw FormatError("Unclosed brace at end of input (" + std::to_string(state.depth)
                          + " still open)");
    }
}

} // namespace

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::string current;
    bool pending = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            lines.push_back(std::move(current));
            current.clear();
            pending = false;
        } else {
            current += c;
            pending = true;
        }
    }

    if (pending) {
        lines.push_back(std::move(current));
    }
    return lines;
}

auto join_lines(const std::vector<std::string>& lines, std::string_view separator) -> std::string {
    std::string text;
    for (const auto& line : lines) {
        text += line;
        text += separator;
    }
    return text;
}

auto reindent(const std::vector<std::string>& lines, const IndentOptions& options)
    -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(lines.size());

    ScanState state;
    std::string comment_indent;
    int pending_blank_lines = 0;
    const int blank_cap = std::max(0, options.blank_lines_to_preserve);

    for (size_t index = 0; index < lines.size(); ++index) {
        const auto& line = lines[index];
        const size_t line_number = index + 1;

        // Literal content is data, never touched
        if (state.region == Region::MULTILINE_LITERAL) {
            result.push_back(line);
            scan_line(line, state, options, line_number, brace_counter(line, state, line_number));
            continue;
        }

        if (state.region == Region::BLOCK_COMMENT) {
            auto trimmed = StringUtils::trim(line);
            if (trimmed.empty()) {
                result.emplace_back();
            } else if (trimmed.front() == '*') {
                result.push_back(comment_indent + " " + trimmed);
            } else {
                result.push_back(StringUtils::trim_trailing(line));
            }
            scan_line(line, state, options, line_number, brace_counter(line, state, line_number));
            continue;
        }

        auto trimmed = StringUtils::trim(line);
        if (trimmed.empty()) {
            pending_blank_lines++;
            continue;
        }

        if (!result.empty()) {
            result.insert(result.end(), static_cast<size_t>(std::min(pending_blank_lines, blank_cap)),
                          std::string());
        }
        pending_blank_lines = 0;

        auto content = line.substr(line.find_first_not_of(" \t"));
        auto indent = indentation(state.depth - count_leading_closers(content), options);
        scan_line(content, state, options, line_number, brace_counter(content, state, line_number));

        // Trailing bytes of a literal left open on this line are part of its value
        if (state.region != Region::MULTILINE_LITERAL) {
            content = StringUtils::trim_trailing(content);
        }
        result.push_back(indent + content);

        if (state.region == Region::BLOCK_COMMENT) {
            comment_indent = indent;
        }
    }

    check_end_of_input(state);
    return result;
}

auto code_view(const std::vector<std::string>& lines, const IndentOptions& options)
    -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(lines.size());

    ScanState state;
    for (size_t index = 0; index < lines.size(); ++index) {
        const auto& line = lines[index];
        std::string code(line.size(), ' ');
        auto count_braces = brace_counter(line, state, index + 1);
        scan_line(line, state, options, index + 1, [&](size_t i) {
            code[i] = line[i];
            count_braces(i);
        });
        result.push_back(std::move(code));
    }

    check_end_of_input(state);
    return result;
}

} // namespace srcfmt::indent_engine
