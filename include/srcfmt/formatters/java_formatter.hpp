#pragma once

#include "srcfmt/formatters/formatter_base.hpp"
#include "srcfmt/types.hpp"
#include <vector>

namespace srcfmt {

// Java sources: brace indentation followed by import regrouping
class JavaFormatter : public FormatterBase {
public:
    explicit JavaFormatter(const ImportOrder& import_order) : import_order_(import_order) {}

    auto name() const -> std::string override { return "Java"; }

    // "1.5" -> 5, "1.8" -> 8, "17" -> 17; throws ConfigError otherwise
    static auto parse_java_level(const std::string& version) -> int;

protected:
    auto extension() const -> std::string override { return ".java"; }
    auto option_prefix() const -> std::string override { return "org.eclipse.jdt.core."; }
    auto configure(const FormatterOptions& options) -> void override;
    auto do_format(const std::string& code, const std::string& line_separator)
        -> std::string override;

private:
    auto check_source_level(const std::vector<std::string>& lines) const -> void;

    const ImportOrder& import_order_;
    int source_level_ = 5;
};

} // namespace srcfmt
