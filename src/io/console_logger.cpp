#include "srcfmt/io/console_logger.hpp"

namespace srcfmt {

auto ConsoleLogger::debug(const std::string& message) -> void {
    if (verbose_) {
        out_ << "debug: " << message << '\n';
    }
}

auto ConsoleLogger::info(const std::string& message) -> void { out_ << message << '\n'; }

auto ConsoleLogger::warn(const std::string& message) -> void {
    err_ << "warn: " << message << '\n';
}

auto ConsoleLogger::error(const std::string& message) -> void {
    err_ << "error: " << message << std::endl;
}

} // namespace srcfmt
