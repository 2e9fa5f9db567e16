#include "srcfmt/formatters/java_formatter.hpp"
#include "srcfmt/errors.hpp"
#include "srcfmt/formatters/import_sorter.hpp"
#include <regex>

namespace srcfmt {

namespace {

// Constructs that need a minimum source level
struct LanguageFeature {
    std::regex pattern;
    int since;
    const char* description;
};

auto language_features() -> const std::vector<LanguageFeature>& {
    static const std::vector<LanguageFeature> features{
        {std::regex(R"(@\s*[A-Za-z_$])"), 5, "annotations"},
        {std::regex(R"((^|[^\w$])enum\s+[A-Za-z_$])"), 5, "enum declarations"},
        {std::regex(R"(->)"), 8, "lambda expressions"},
    };
    return features;
}

} // namespace

auto JavaFormatter::parse_java_level(const std::string& version) -> int {
    std::string number = version.starts_with("1.") ? version.substr(2) : version;
    try {
        size_t consumed = 0;
        int level = std::stoi(number, &consumed);
        if (consumed == number.size() && level > 0) {
            return level;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    throw ConfigError("Invalid Java compiler version '" + version + "'");
}

auto JavaFormatter::configure(const FormatterOptions& options) -> void {
    source_level_ = parse_java_level(option(options, option_prefix() + "compiler.source"));
    // Compliance and target are validated so a bad build configuration fails early
    parse_java_level(option(options, option_prefix() + "compiler.compliance"));
    parse_java_level(option(options, option_prefix() + "compiler.codegen.targetPlatform"));

    indent_options_.multiline_literal = source_level_ >= 15 ? "\"\"\"" : "";
}

auto JavaFormatter::do_format(const std::string& code, const std::string& line_separator)
    -> std::string {
    auto lines = indent_engine::split_lines(code);
    check_source_level(indent_engine::code_view(lines, indent_options_));

    auto formatted = indent_engine::reindent(lines, indent_options_);
    formatted = sort_imports(formatted, import_order_);
    return indent_engine::join_lines(formatted, line_separator);
}

auto JavaFormatter::check_source_level(const std::vector<std::string>& lines) const -> void {
    for (const auto& feature : language_features()) {
        if (source_level_ >= feature.since) {
            continue;
        }
        for (size_t i = 0; i < lines.size(); ++i) {
            if (std::regex_search(lines[i], feature.pattern)) {
                throw FormatError("Code cannot be formatted: " + std::string(feature.description)
                                  + " at line " + std::to_string(i + 1) + " need source level "
                                  + std::to_string(feature.since)
                                  + ". Possible cause is unmatched source/target/compliance version.");
            }
        }
    }
}

} // namespace srcfmt
