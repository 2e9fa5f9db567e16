#include "srcfmt/config/app_config.hpp"
#include "srcfmt/core/encoding.hpp"
#include "srcfmt/core/line_ending.hpp"
#include "srcfmt/core/string_utils.hpp"
#include "srcfmt/errors.hpp"
#include <sstream>

namespace srcfmt {

auto default_directories() -> std::vector<std::string> {
    return {"src/main/java", "src/test/java", "src/main/js"};
}

auto default_includes() -> std::vector<std::string> {
    return {"**/*.java", "**/*.js"};
}

auto parse_args(const std::vector<std::string>& args) -> AppConfig {
    AppConfig config;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--basedir") {
            config.basedir = value();
        } else if (arg == "-d" || arg == "--directory") {
            config.directories.push_back(value());
        } else if (arg == "--include") {
            config.includes.push_back(value());
        } else if (arg == "--exclude") {
            config.excludes.push_back(value());
        } else if (arg == "--target") {
            config.target_directory = value();
        } else if (arg == "--config-file") {
            config.config_file = value();
        } else if (arg == "--config-js-file") {
            config.config_js_file = value();
        } else if (arg == "--import-order-file") {
            config.import_order_file = value();
        } else if (arg == "--unmatched-imports") {
            auto placement = StringUtils::to_lowercase(value());
            if (placement == "first") {
                config.unmatched_imports = UnmatchedImports::FIRST;
            } else if (placement == "last") {
                config.unmatched_imports = UnmatchedImports::LAST;
            } else {
                throw ConfigError("--unmatched-imports expects 'first' or 'last', got '"
                                  + placement + "'");
            }
        } else if (arg == "--compiler-source") {
            config.compiler_source = value();
        } else if (arg == "--compiler-compliance") {
            config.compiler_compliance = value();
        } else if (arg == "--compiler-target") {
            config.compiler_target = value();
        } else if (arg == "--encoding") {
            config.encoding = value();
        } else if (arg == "--line-ending") {
            config.line_ending = value();
        } else if (arg == "--skip") {
            config.skip = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return config;
}

auto usage() -> std::string {
    std::ostringstream oss;
    oss << "Usage: srcfmt [options]\n";
    oss << "  --basedir <dir>              Project base directory (default: .)\n";
    oss << "  -d, --directory <dir>        Source directory to format, repeatable\n";
    oss << "                               (default: src/main/java, src/test/java, src/main/js)\n";
    oss << "  --include <pattern>          Include pattern, repeatable (default: **/*.java, **/*.js)\n";
    oss << "  --exclude <pattern>          Exclude pattern, repeatable\n";
    oss << "  --target <dir>               Directory holding the hash cache (default: target)\n";
    oss << "  --config-file <file>         Java formatter options, empty for defaults\n";
    oss << "  --config-js-file <file>      JavaScript formatter options, empty for defaults\n";
    oss << "  --import-order-file <file>   Java import group order (index=prefix per line)\n";
    oss << "  --unmatched-imports <where>  Place imports matching no group 'first' or 'last'\n";
    oss << "  --compiler-source <ver>      Java source level (default: 1.5)\n";
    oss << "  --compiler-compliance <ver>  Java compliance level (default: 1.5)\n";
    oss << "  --compiler-target <ver>      Java target platform (default: 1.5)\n";
    oss << "  --encoding <name>            UTF-8, US-ASCII or ISO-8859-1\n";
    oss << "  --line-ending <style>        AUTO, KEEP, LF, CRLF or CR (default: AUTO)\n";
    oss << "  --skip                       Do nothing\n";
    oss << "  --dry-run                    Report changes without modifying files\n";
    oss << "  -v, --verbose                Print per-file details\n";
    oss << "  -h, --help                   Show this help\n";
    return oss.str();
}

auto build_configuration(const AppConfig& config, ILogger& logger) -> Configuration {
    Configuration configuration;
    configuration.compiler_source = config.compiler_source;
    configuration.compiler_compliance = config.compiler_compliance;
    configuration.compiler_target = config.compiler_target;
    configuration.target_directory = config.target_directory;
    configuration.line_ending = line_endings::parse(config.line_ending);

    if (StringUtils::trim(config.encoding).empty()) {
        configuration.encoding = encodings::platform_default();
        logger.warn("File encoding has not been set, using platform encoding ("
                    + encodings::name(configuration.encoding)
                    + ") to format source files, i.e. build is platform dependent!");
    } else {
        configuration.encoding = encodings::parse(config.encoding);
        logger.info("Using '" + encodings::name(configuration.encoding)
                    + "' encoding to format source files.");
    }

    return configuration;
}

} // namespace srcfmt
