#include "srcfmt/application/formatter_app.hpp"
#include "srcfmt/application/run_orchestrator.hpp"
#include "srcfmt/config/options_loader.hpp"
#include "srcfmt/core/hash_cache.hpp"
#include "srcfmt/core/import_order.hpp"
#include "srcfmt/errors.hpp"
#include "srcfmt/formatters/java_formatter.hpp"
#include "srcfmt/formatters/javascript_formatter.hpp"
#include "srcfmt/io/file_collector.hpp"

namespace srcfmt {

namespace {

const std::string file_suffix = " file(s)";

auto resolve_against(const std::filesystem::path& basedir, const std::string& path)
    -> std::filesystem::path {
    std::filesystem::path resolved(path);
    if (resolved.is_relative()) {
        resolved = basedir / resolved;
    }
    return resolved.lexically_normal();
}

} // namespace

FormatterApp::FormatterApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<ILogger> logger)
    : filesystem_(std::move(filesystem)), logger_(std::move(logger)) {}

auto FormatterApp::run(const AppConfig& config) -> int {
    if (config.skip) {
        logger_->info("Formatting is skipped");
        return 0;
    }

    auto start = std::chrono::steady_clock::now();

    try {
        auto configuration = build_configuration(config, *logger_);
        auto basedir = std::filesystem::absolute(config.basedir).lexically_normal();

        std::vector<std::filesystem::path> directories;
        for (const auto& directory :
             config.directories.empty() ? default_directories() : config.directories) {
            directories.push_back(resolve_against(basedir, directory));
        }

        auto files = collect_files(directories,
                                   config.includes.empty() ? default_includes() : config.includes,
                                   config.excludes);
        logger_->info("Number of files to be formatted: " + std::to_string(files.size()));
        if (files.empty()) {
            return 0;
        }

        auto formatters = create_formatters(config, configuration, basedir);
        RunOrchestrator::require_initialized(formatters);
        auto cache_store
            = locate_cache_store(resolve_against(basedir, configuration.target_directory), *logger_);

        RunSettings settings{.basedir = basedir,
                             .processor = {.line_ending = configuration.line_ending,
                                           .encoding = configuration.encoding,
                                           .dry_run = config.dry_run}};
        RunOrchestrator orchestrator(*filesystem_, *logger_, std::move(formatters), settings);
        auto statistics = orchestrator.run(files, cache_store);

        show_summary(statistics, std::chrono::steady_clock::now() - start);
        if (config.dry_run) {
            logger_->info("Dry run - no files modified.");
        }
        return 0;

    } catch (const ConfigError& e) {
        logger_->error(e.what());
        return 1;
    } catch (const IoError& e) {
        logger_->error(e.what());
        return 1;
    }
}

auto FormatterApp::create_formatters(const AppConfig& config, const Configuration& configuration,
                                     const std::filesystem::path& basedir) -> FormatterList {
    FormatterList formatters;

    auto java = std::make_unique<JavaFormatter>(import_order_);
    if (auto options = load_formatter_options(config.config_file, basedir)) {
        import_order_.groups = resolve_import_order(config.import_order_file, basedir);
        import_order_.unmatched = config.unmatched_imports;
        java->initialize(*options, configuration);
    } else {
        logger_->debug("Config file [" + config.config_file + "] cannot be found");
    }
    formatters.push_back(std::move(java));

    auto javascript = std::make_unique<JavaScriptFormatter>();
    if (auto options = load_formatter_options(config.config_js_file, basedir)) {
        javascript->initialize(*options, configuration);
    } else {
        logger_->debug("Config file [" + config.config_js_file + "] cannot be found");
    }
    formatters.push_back(std::move(javascript));

    return formatters;
}

auto FormatterApp::show_summary(const RunStatistics& statistics,
                                std::chrono::steady_clock::duration elapsed) -> void {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();

    logger_->info("Successfully formatted:          " + std::to_string(statistics.success_count)
                  + file_suffix);
    logger_->info("Fail to format:                  " + std::to_string(statistics.fail_count)
                  + file_suffix);
    logger_->info("Skipped:                         " + std::to_string(statistics.skipped_count)
                  + file_suffix);
    logger_->info("Read only skipped:               " + std::to_string(statistics.read_only_count)
                  + file_suffix);
    logger_->info("Approximate time taken:          " + std::to_string(seconds) + "s");
}

} // namespace srcfmt
