#include "srcfmt/core/import_order.hpp"
#include "srcfmt/core/string_utils.hpp"
#include "srcfmt/errors.hpp"
#include <fstream>
#include <map>
#include <system_error>

namespace srcfmt {

auto default_import_order() -> std::vector<std::string> {
    return {"java", "javax", "org", "com"};
}

auto resolve_import_order(const std::string& order_file, const std::filesystem::path& basedir)
    -> std::vector<std::string> {
    if (StringUtils::trim(order_file).empty()) {
        return default_import_order();
    }

    std::filesystem::path path(order_file);
    if (path.is_relative()) {
        path = basedir / path;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw ConfigError("Cannot find config file [" + order_file + "]");
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IoError("Cannot read config file [" + order_file + "]");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw IoError("Cannot read config file [" + order_file + "]");
    }

    auto order = parse_import_order(file, order_file);
    if (file.bad()) {
        throw IoError("Cannot read config file [" + order_file + "]");
    }
    return order;
}

auto parse_import_order(std::istream& in, const std::string& source_name)
    -> std::vector<std::string> {
    std::map<int, std::string> ordered;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (StringUtils::is_blank(line) || line.front() == '#') {
            continue;
        }

        auto equals = line.find('=');
        auto index_text = StringUtils::trim(line.substr(0, equals));
        auto prefix = equals == std::string::npos ? std::string()
                                                  : StringUtils::trim(line.substr(equals + 1));

        int index = 0;
        try {
            size_t consumed = 0;
            index = std::stoi(index_text, &consumed);
            if (consumed != index_text.size()) {
                throw std::invalid_argument(index_text);
            }
        } catch (const std::exception&) {
            throw ConfigError("Invalid import order entry '" + line + "' in [" + source_name + "]");
        }

        ordered[index] = prefix;
    }

    std::vector<std::string> order;
    order.reserve(ordered.size());
    for (const auto& [index, prefix] : ordered) {
        order.push_back(prefix);
    }
    return order;
}

} // namespace srcfmt
