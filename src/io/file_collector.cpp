#include "srcfmt/io/file_collector.hpp"
#include <fnmatch.h>
#include <algorithm>
#include <set>
#include <system_error>

namespace srcfmt {

namespace {

const std::set<std::string> vcs_directories{".git", ".svn", ".hg", ".bzr", "CVS"};

auto split_segments(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        auto end = slash == std::string_view::npos ? path.size() : slash;
        if (end > start) {
            segments.emplace_back(path.substr(start, end - start));
        }
        if (slash == std::string_view::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

auto match_segments(const std::vector<std::string>& pattern, size_t pi,
                    const std::vector<std::string>& path, size_t si) -> bool {
    if (pi == pattern.size()) {
        return si == path.size();
    }
    if (pattern[pi] == "**") {
        for (size_t k = si; k <= path.size(); ++k) {
            if (match_segments(pattern, pi + 1, path, k)) {
                return true;
            }
        }
        return false;
    }
    if (si == path.size()) {
        return false;
    }
    if (fnmatch(pattern[pi].c_str(), path[si].c_str(), FNM_CASEFOLD) != 0) {
        return false;
    }
    return match_segments(pattern, pi + 1, path, si + 1);
}

auto matches_any(const std::string& relative_path, const std::vector<std::string>& patterns)
    -> bool {
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& pattern) {
        return matches_pattern(relative_path, pattern);
    });
}

} // namespace

auto matches_pattern(std::string_view relative_path, std::string_view pattern) -> bool {
    std::string normalized(pattern);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    if (!normalized.empty() && normalized.back() == '/') {
        normalized += "**";
    }
    return match_segments(split_segments(normalized), 0, split_segments(relative_path), 0);
}

auto collect_files(const std::vector<std::filesystem::path>& directories,
                   const std::vector<std::string>& includes,
                   const std::vector<std::string>& excludes) -> std::vector<std::string> {
    std::set<std::string> found;

    for (const auto& directory : directories) {
        std::error_code ec;
        if (!std::filesystem::is_directory(directory, ec)) {
            continue;
        }

        auto root = std::filesystem::absolute(directory, ec).lexically_normal();
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        const std::filesystem::recursive_directory_iterator end;

        for (; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            if (entry.is_symlink(ec)) {
                if (entry.is_directory(ec)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (entry.is_directory(ec)) {
                if (vcs_directories.count(entry.path().filename().string()) > 0) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!entry.is_regular_file(ec)) {
                continue;
            }

            auto relative = entry.path().lexically_relative(root).generic_string();
            if (matches_any(relative, includes) && !matches_any(relative, excludes)) {
                found.insert(entry.path().string());
            }
        }
    }

    return {found.begin(), found.end()};
}

} // namespace srcfmt
