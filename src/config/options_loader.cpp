#include "srcfmt/config/options_loader.hpp"
#include "srcfmt/core/string_utils.hpp"
#include "srcfmt/errors.hpp"
#include <fstream>
#include <system_error>

namespace srcfmt {

auto load_formatter_options(const std::string& config_file, const std::filesystem::path& basedir)
    -> std::optional<FormatterOptions> {
    if (StringUtils::trim(config_file).empty()) {
        return FormatterOptions{};
    }

    std::filesystem::path path(config_file);
    if (path.is_relative()) {
        path = basedir / path;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open() || !std::filesystem::is_regular_file(path, ec)) {
        throw ConfigError("Cannot read config file [" + config_file + "]");
    }

    auto options = parse_formatter_options(file, config_file);
    if (file.bad()) {
        throw ConfigError("Cannot read config file [" + config_file + "]");
    }
    return options;
}

auto parse_formatter_options(std::istream& in, const std::string& source_name) -> FormatterOptions {
    FormatterOptions options;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        auto trimmed = StringUtils::trim(line);
        if (!trimmed.empty() && trimmed.back() == '\r') {
            trimmed = StringUtils::trim(trimmed.substr(0, trimmed.size() - 1));
        }
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == '!') {
            continue;
        }

        auto separator = trimmed.find_first_of("=:");
        if (separator == std::string::npos || separator == 0) {
            throw ConfigError("Cannot parse config file [" + source_name + "]: malformed line "
                              + std::to_string(line_number));
        }

        options[StringUtils::trim(trimmed.substr(0, separator))]
            = StringUtils::trim(trimmed.substr(separator + 1));
    }

    return options;
}

} // namespace srcfmt
