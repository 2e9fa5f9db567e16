#pragma once

#include "srcfmt/interfaces.hpp"
#include <ostream>

namespace srcfmt {

// Info and debug to out, warnings and errors to err. Debug only when verbose.
class ConsoleLogger : public ILogger {
public:
    ConsoleLogger(std::ostream& out, std::ostream& err, bool verbose)
        : out_(out), err_(err), verbose_(verbose) {}

    auto debug(const std::string& message) -> void override;
    auto info(const std::string& message) -> void override;
    auto warn(const std::string& message) -> void override;
    auto error(const std::string& message) -> void override;

private:
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
};

} // namespace srcfmt
