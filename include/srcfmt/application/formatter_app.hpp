#pragma once

#include "srcfmt/application/file_processor.hpp"
#include "srcfmt/config/app_config.hpp"
#include "srcfmt/interfaces.hpp"
#include "srcfmt/types.hpp"
#include <chrono>
#include <filesystem>
#include <memory>

namespace srcfmt {

// Command line front end: configuration, file discovery, formatter setup, run, summary
class FormatterApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<ILogger> logger_;
    ImportOrder import_order_;  // Read by the Java formatter for the whole run

public:
    FormatterApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<ILogger> logger);

    // Exit status: 0 on completed runs (even with per-file failures), 1 on configuration errors
    auto run(const AppConfig& config) -> int;

private:
    auto create_formatters(const AppConfig& config, const Configuration& configuration,
                           const std::filesystem::path& basedir) -> FormatterList;
    auto show_summary(const RunStatistics& statistics, std::chrono::steady_clock::duration elapsed)
        -> void;
};

} // namespace srcfmt
