#pragma once

#include "srcfmt/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace srcfmt {

struct ImportStatement {
    std::string name;  // Fully-qualified name, e.g. "java.util.List" or "org.junit.Assert.*"
    bool is_static = false;
    std::string text;  // Line as written
    std::vector<std::string> comments;  // Comment lines directly above the import
};

// Parses a single "import [static] name;" line
auto parse_import_line(std::string_view line) -> std::optional<ImportStatement>;

// True if prefix names a package or type that contains name
auto matches_import_prefix(std::string_view name, std::string_view prefix) -> bool;

// Slot of an import in the emitted order: 0 holds unmatched imports placed FIRST,
// 1..groups.size() the configured groups, groups.size() + 1 unmatched imports placed LAST
auto import_slot(std::string_view name, const ImportOrder& order) -> size_t;

// Regroups the leading import block of a Java compilation unit. Static imports come first,
// each group is sorted by name and groups are separated by one blank line. Comment lines
// inside the block stay attached to the import that follows them.
auto sort_imports(const std::vector<std::string>& lines, const ImportOrder& order)
    -> std::vector<std::string>;

} // namespace srcfmt
