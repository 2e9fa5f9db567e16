#pragma once

#include "srcfmt/types.hpp"
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace srcfmt {

// Loads a properties-style formatter option file ("key=value" or "key: value", '#' and '!'
// comments). An empty path yields an empty option set (compiler defaults only), a file that
// does not exist yields std::nullopt. Throws ConfigError if the file cannot be read or parsed.
auto load_formatter_options(const std::string& config_file, const std::filesystem::path& basedir)
    -> std::optional<FormatterOptions>;

auto parse_formatter_options(std::istream& in, const std::string& source_name) -> FormatterOptions;

} // namespace srcfmt
