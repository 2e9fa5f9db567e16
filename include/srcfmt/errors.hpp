#pragma once

#include <stdexcept>
#include <string>

namespace srcfmt {

// Required configuration is missing or unusable. Aborts the run before any file is touched.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// The formatting engine could not produce output for one file.
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

// A file or configuration resource could not be read or written.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace srcfmt
