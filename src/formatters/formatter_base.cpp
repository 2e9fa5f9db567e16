#include "srcfmt/formatters/formatter_base.hpp"
#include "srcfmt/core/line_ending.hpp"
#include "srcfmt/core/string_utils.hpp"
#include "srcfmt/errors.hpp"

namespace srcfmt {

auto FormatterBase::default_options(const Configuration& config) const -> FormatterOptions {
    auto prefix = option_prefix();
    return FormatterOptions{
        {prefix + "compiler.source", config.compiler_source},
        {prefix + "compiler.compliance", config.compiler_compliance},
        {prefix + "compiler.codegen.targetPlatform", config.compiler_target},
        {prefix + "formatter.tabulation.char", "space"},
        {prefix + "formatter.tabulation.size", "4"},
        {prefix + "formatter.number_of_empty_lines_to_preserve", "1"},
    };
}

auto FormatterBase::initialize(const FormatterOptions& options, const Configuration& config)
    -> void {
    initialized_ = false;

    // Explicit options override the compiler-derived defaults
    auto merged = default_options(config);
    for (const auto& [key, value] : options) {
        merged[key] = value;
    }

    auto prefix = option_prefix();
    auto tab_char = StringUtils::to_lowercase(option(merged, prefix + "formatter.tabulation.char"));
    if (tab_char != "space" && tab_char != "tab") {
        throw ConfigError("Invalid value '" + tab_char + "' for " + prefix
                          + "formatter.tabulation.char");
    }

    indent_options_.use_tabs = tab_char == "tab";
    indent_options_.tab_size = int_option(merged, prefix + "formatter.tabulation.size", 1, 16);
    indent_options_.blank_lines_to_preserve
        = int_option(merged, prefix + "formatter.number_of_empty_lines_to_preserve", 0, 10);

    configure(merged);
    initialized_ = true;
}

auto FormatterBase::handles(const std::filesystem::path& file) const -> bool {
    return file.extension().string() == extension();
}

auto FormatterBase::format(const std::string& code, LineEnding ending)
    -> std::optional<std::string> {
    if (!initialized_) {
        throw FormatError(name() + " formatter used before initialization");
    }

    auto separator = line_endings::resolve_separator(ending, code);
    auto formatted = do_format(code, separator);
    if (formatted == code) {
        return std::nullopt;
    }
    return formatted;
}

auto FormatterBase::option(const FormatterOptions& options, const std::string& key) const
    -> std::string {
    auto it = options.find(key);
    if (it == options.end()) {
        return "";
    }
    return StringUtils::trim(it->second);
}

auto FormatterBase::int_option(const FormatterOptions& options, const std::string& key, int min,
                               int max) const -> int {
    auto text = option(options, key);
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed == text.size() && value >= min && value <= max) {
            return value;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    throw ConfigError("Invalid value '" + text + "' for " + key + ", expected " + std::to_string(min)
                      + ".." + std::to_string(max));
}

} // namespace srcfmt
