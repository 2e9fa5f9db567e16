#pragma once

#include "srcfmt/application/file_processor.hpp"
#include "srcfmt/interfaces.hpp"
#include "srcfmt/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace srcfmt {

struct RunSettings {
    std::filesystem::path basedir = ".";
    ProcessorSettings processor;
};

class RunOrchestrator {
public:
    RunOrchestrator(IFileSystem& file_system, ILogger& logger, FormatterList formatters,
                    RunSettings settings);

    // Formats every candidate and returns the per-outcome counts. Without a cache store
    // the run starts from an empty cache and nothing is persisted.
    // Throws ConfigError, before touching any file, when no formatter is initialized.
    auto run(const std::vector<std::string>& candidate_files,
             const std::optional<std::filesystem::path>& cache_store) -> RunStatistics;

    // Throws ConfigError unless at least one formatter is initialized
    static auto require_initialized(const FormatterList& formatters) -> void;

    // Canonical path relative to the base directory, '/'-separated. Files outside the base
    // directory are keyed by their canonical absolute path.
    auto cache_key(const std::string& path) const -> std::string;

private:
    IFileSystem& file_system_;
    ILogger& logger_;
    FormatterList formatters_;
    RunSettings settings_;
};

} // namespace srcfmt
