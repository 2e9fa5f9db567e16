#pragma once

#include "srcfmt/formatters/indent_engine.hpp"
#include "srcfmt/interfaces.hpp"
#include <string>

namespace srcfmt {

// Shared behaviour of the built-in formatters: option handling, line-ending resolution
// and the "unchanged means std::nullopt" rule
class FormatterBase : public IFormatter {
public:
    auto initialize(const FormatterOptions& options, const Configuration& config) -> void override;
    auto is_initialized() const -> bool override { return initialized_; }
    auto handles(const std::filesystem::path& file) const -> bool override;
    auto format(const std::string& code, LineEnding ending) -> std::optional<std::string> override;

    // Options used when no configuration file supplies them
    auto default_options(const Configuration& config) const -> FormatterOptions;

protected:
    // File extension handled, including the dot
    virtual auto extension() const -> std::string = 0;
    // Key prefix of this language's options, e.g. "org.eclipse.jdt.core."
    virtual auto option_prefix() const -> std::string = 0;
    // Language specific part of initialize(); options already hold the defaults
    virtual auto configure(const FormatterOptions& options) -> void = 0;
    virtual auto do_format(const std::string& code, const std::string& line_separator)
        -> std::string = 0;

    auto option(const FormatterOptions& options, const std::string& key) const -> std::string;
    auto int_option(const FormatterOptions& options, const std::string& key, int min, int max) const
        -> int;

    indent_engine::IndentOptions indent_options_;

private:
    bool initialized_ = false;
};

} // namespace srcfmt
