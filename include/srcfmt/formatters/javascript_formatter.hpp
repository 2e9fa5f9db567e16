#pragma once

#include "srcfmt/formatters/formatter_base.hpp"

namespace srcfmt {

class JavaScriptFormatter : public FormatterBase {
public:
    auto name() const -> std::string override { return "JavaScript"; }

protected:
    auto extension() const -> std::string override { return ".js"; }
    auto option_prefix() const -> std::string override { return "org.eclipse.wst.jsdt.core."; }
    auto configure(const FormatterOptions& options) -> void override;
    auto do_format(const std::string& code, const std::string& line_separator)
        -> std::string override;
};

} // namespace srcfmt
