#pragma once

#include "srcfmt/interfaces.hpp"
#include "srcfmt/types.hpp"
#include <string>
#include <vector>

namespace srcfmt {

struct AppConfig {
    std::string basedir = ".";
    std::vector<std::string> directories;   // Defaults used when empty
    std::vector<std::string> includes;      // Defaults used when empty
    std::vector<std::string> excludes;
    std::string target_directory = "target";
    std::string config_file = "src/config/formatter/java.properties";
    std::string config_js_file = "src/config/formatter/javascript.properties";
    std::string import_order_file;          // Default group order when empty
    UnmatchedImports unmatched_imports = UnmatchedImports::LAST;
    std::string compiler_source = "1.5";
    std::string compiler_compliance = "1.5";
    std::string compiler_target = "1.5";
    std::string encoding;                   // Platform encoding when empty
    std::string line_ending = "AUTO";
    bool skip = false;
    bool dry_run = false;
    bool verbose = false;
    bool show_help = false;
};

auto default_directories() -> std::vector<std::string>;
auto default_includes() -> std::vector<std::string>;

// Command line arguments without the program name. Throws ConfigError on unknown options
// and missing or invalid values.
auto parse_args(const std::vector<std::string>& args) -> AppConfig;

auto usage() -> std::string;

// Validated settings shared with the formatters. Throws ConfigError.
auto build_configuration(const AppConfig& config, ILogger& logger) -> Configuration;

} // namespace srcfmt
