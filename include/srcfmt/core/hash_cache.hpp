#pragma once

#include "srcfmt/interfaces.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace srcfmt {

// Project-relative path -> digest of the file as it was left by the last run
class HashCache {
public:
    static constexpr const char* store_file_name = "srcfmt-cache.properties";

    // Missing, unreadable or corrupt stores all yield an empty cache
    static auto load(const std::filesystem::path& store, ILogger& logger) -> HashCache;

    auto get(const std::string& path) const -> std::optional<std::string>;
    auto put(const std::string& path, const std::string& digest) -> void;

    // Atomically replaces the store with the whole mapping. False on failure.
    auto persist(const std::filesystem::path& store) const -> bool;

    auto size() const -> size_t { return entries_.size(); }
    auto entries() const -> const std::map<std::string, std::string>& { return entries_; }

private:
    std::map<std::string, std::string> entries_;
};

// Cache store location inside the target directory; creates the directory when missing.
// Returns std::nullopt (with a warning) when the target path is not a usable directory.
auto locate_cache_store(const std::filesystem::path& target_directory, ILogger& logger)
    -> std::optional<std::filesystem::path>;

// Properties-style key escaping
auto escape_cache_key(std::string_view key) -> std::string;
auto unescape_cache_key(std::string_view escaped) -> std::optional<std::string>;

} // namespace srcfmt
