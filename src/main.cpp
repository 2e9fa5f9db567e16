#include "srcfmt/application/formatter_app.hpp"
#include "srcfmt/config/app_config.hpp"
#include "srcfmt/errors.hpp"
#include "srcfmt/io/console_logger.hpp"
#include "srcfmt/io/file_system.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace srcfmt;

    AppConfig config;
    try {
        config = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage();
        return 1;
    }

    if (config.show_help) {
        std::cout << usage();
        std::cout << "\nExamples:\n";
        std::cout << "  srcfmt                                      # Format the default source directories\n";
        std::cout << "  srcfmt -d src --line-ending LF              # Force Unix line endings\n";
        std::cout << "  srcfmt --config-file '' --dry-run           # Default options, preview only\n";
        return 0;
    }

    FormatterApp app(std::make_unique<FileSystem>(),
                     std::make_unique<ConsoleLogger>(std::cout, std::cerr, config.verbose));

    try {
        return app.run(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 2;
    }
}
