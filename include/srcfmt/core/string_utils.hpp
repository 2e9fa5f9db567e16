#pragma once

#include <string>
#include <string_view>

namespace srcfmt {

class StringUtils {
public:
    // Strip leading and trailing spaces/tabs
    static auto trim(std::string_view text) -> std::string;

    // Strip trailing spaces/tabs only
    static auto trim_trailing(std::string_view text) -> std::string;

    static auto to_lowercase(std::string_view text) -> std::string;

    // True for empty lines and lines holding only spaces/tabs
    static auto is_blank(std::string_view line) -> bool;
};

} // namespace srcfmt
