#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace srcfmt {

// Ant-style pattern match of a '/'-separated relative path, case-insensitive.
// "**" spans any number of directories, a trailing '/' means "everything below".
auto matches_pattern(std::string_view relative_path, std::string_view pattern) -> bool;

// Regular files under the existing directories whose relative path matches an include and
// no exclude. Symlinks and version-control directories are skipped. The result holds
// absolute paths, sorted and free of duplicates.
auto collect_files(const std::vector<std::filesystem::path>& directories,
                   const std::vector<std::string>& includes,
                   const std::vector<std::string>& excludes) -> std::vector<std::string>;

} // namespace srcfmt
