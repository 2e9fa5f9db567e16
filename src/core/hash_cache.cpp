#include "srcfmt/core/hash_cache.hpp"
#include "srcfmt/core/digest.hpp"
#include "srcfmt/core/string_utils.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

namespace srcfmt {

namespace {

// Splits "key=value" at the first unescaped '='
auto split_entry(const std::string& line) -> std::optional<std::pair<std::string, std::string>> {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\') {
            ++i;
            continue;
        }
        if (line[i] == '=') {
            return std::make_pair(line.substr(0, i), line.substr(i + 1));
        }
    }
    return std::nullopt;
}

auto parse_store(std::istream& in, std::map<std::string, std::string>& entries) -> bool {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (StringUtils::is_blank(line) || line.front() == '#' || line.front() == '!') {
            continue;
        }

        auto entry = split_entry(line);
        if (!entry) {
            return false;
        }

        auto key = unescape_cache_key(entry->first);
        auto value = StringUtils::trim(entry->second);
        if (!key || key->empty() || !digest::is_hex_digest(value)) {
            return false;
        }
        entries[*key] = value;
    }
    return !in.bad();
}

} // namespace

auto HashCache::load(const std::filesystem::path& store, ILogger& logger) -> HashCache {
    HashCache cache;

    std::error_code ec;
    if (!std::filesystem::exists(store, ec)) {
        return cache;
    }

    std::ifstream file(store, std::ios::binary);
    if (!file.is_open()) {
        logger.warn("Cannot load file hash cache properties file " + store.string());
        return cache;
    }

    std::map<std::string, std::string> entries;
    if (!parse_store(file, entries)) {
        logger.warn("File hash cache " + store.string() + " is corrupt, ignoring it");
        return cache;
    }

    cache.entries_ = std::move(entries);
    logger.debug("Loaded " + std::to_string(cache.entries_.size()) + " cached hashes from "
                 + store.string());
    return cache;
}

auto HashCache::get(const std::string& path) const -> std::optional<std::string> {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto HashCache::put(const std::string& path, const std::string& digest) -> void {
    entries_[path] = digest;
}

auto HashCache::persist(const std::filesystem::path& store) const -> bool {
    auto temp_path = store;
    temp_path += ".tmp";

    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return false;
            }

            file << "#srcfmt file hash cache\n";
            for (const auto& [path, digest] : entries_) {
                file << escape_cache_key(path) << "=" << digest << "\n";
            }

            file.flush();
            if (file.fail()) {
                file.close();
                std::error_code ec;
                std::filesystem::remove(temp_path, ec);
                return false;
            }
        }

        std::filesystem::rename(temp_path, store);
        return true;

    } catch (const std::exception&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return false;
    }
}

auto locate_cache_store(const std::filesystem::path& target_directory, ILogger& logger)
    -> std::optional<std::filesystem::path> {
    std::error_code ec;
    if (!std::filesystem::exists(target_directory, ec)) {
        if (!std::filesystem::create_directories(target_directory, ec) && ec) {
            logger.warn("Cannot create target directory '" + target_directory.string()
                        + "': " + ec.message());
            return std::nullopt;
        }
    } else if (!std::filesystem::is_directory(target_directory, ec)) {
        logger.warn("Something strange here as the '" + target_directory.string()
                    + "' supposedly target directory is not a directory.");
        return std::nullopt;
    }
    return target_directory / HashCache::store_file_name;
}

auto escape_cache_key(std::string_view key) -> std::string {
    std::string escaped;
    escaped.reserve(key.size());

    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        switch (c) {
        case '\\':
        case '=':
        case ':':
            escaped += '\\';
            escaped += c;
            break;
        case '#':
        case '!':
        case ' ':
            if (i == 0) {
                escaped += '\\';
            }
            escaped += c;
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            escaped += "\\r";
            break;
        case '\t':
            escaped += "\\t";
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

auto unescape_cache_key(std::string_view escaped) -> std::optional<std::string> {
    std::string key;
    key.reserve(escaped.size());

    for (size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] != '\\') {
            key += escaped[i];
            continue;
        }
        if (i + 1 >= escaped.size()) {
            return std::nullopt; // Dangling escape
        }
        char next = escaped[++i];
        switch (next) {
        case 'n':
            key += '\n';
            break;
        case 'r':
            key += '\r';
            break;
        case 't':
            key += '\t';
            break;
        default:
            key += next;
        }
    }
    return key;
}

} // namespace srcfmt
