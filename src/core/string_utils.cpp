#include "srcfmt/core/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace srcfmt {

auto StringUtils::trim(std::string_view text) -> std::string {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return std::string(text.substr(start, end - start + 1));
}

auto StringUtils::trim_trailing(std::string_view text) -> std::string {
    size_t end = text.find_last_not_of(" \t");
    if (end == std::string_view::npos) {
        return "";
    }
    return std::string(text.substr(0, end + 1));
}

auto StringUtils::to_lowercase(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto StringUtils::is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t") == std::string_view::npos;
}

} // namespace srcfmt
