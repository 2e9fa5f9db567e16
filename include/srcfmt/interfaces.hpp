#pragma once

#include "srcfmt/types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace srcfmt {

// Abstract interfaces for dependency injection

class ILogger {
public:
    virtual ~ILogger() = default;
    virtual auto debug(const std::string& message) -> void = 0;
    virtual auto info(const std::string& message) -> void = 0;
    virtual auto warn(const std::string& message) -> void = 0;
    virtual auto error(const std::string& message) -> void = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    // Whole-file read, throws IoError
    virtual auto read_file(const std::string& path) -> std::string = 0;
    // Whole-file replace-or-fail, throws IoError
    virtual auto write_file(const std::string& path, const std::string& content) -> void = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto is_writable(const std::string& path) -> bool = 0;
};

// One implementation per supported language
class IFormatter {
public:
    virtual ~IFormatter() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto initialize(const FormatterOptions& options, const Configuration& config) -> void = 0;
    virtual auto is_initialized() const -> bool = 0;
    virtual auto handles(const std::filesystem::path& file) const -> bool = 0;
    // Formatted text, or std::nullopt when the input is already canonical.
    // Throws FormatError when the engine cannot format the input.
    virtual auto format(const std::string& code, LineEnding ending) -> std::optional<std::string> = 0;
};

} // namespace srcfmt
