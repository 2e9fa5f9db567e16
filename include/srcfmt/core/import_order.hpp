#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace srcfmt {

// Group order used when no import order file is configured
auto default_import_order() -> std::vector<std::string>;

// Reads an "index=prefix" import order file. An empty path yields the default order.
// Relative paths are resolved against basedir.
// Throws ConfigError when the file cannot be found or holds a malformed entry,
// IoError when it cannot be read.
auto resolve_import_order(const std::string& order_file, const std::filesystem::path& basedir)
    -> std::vector<std::string>;

// Parses import order entries from a stream; source_name is used in error messages
auto parse_import_order(std::istream& in, const std::string& source_name)
    -> std::vector<std::string>;

} // namespace srcfmt
