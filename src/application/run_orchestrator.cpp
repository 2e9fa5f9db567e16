#include "srcfmt/application/run_orchestrator.hpp"
#include "srcfmt/core/hash_cache.hpp"
#include "srcfmt/errors.hpp"
#include <algorithm>
#include <system_error>

namespace srcfmt {

RunOrchestrator::RunOrchestrator(IFileSystem& file_system, ILogger& logger,
                                 FormatterList formatters, RunSettings settings)
    : file_system_(file_system), logger_(logger), formatters_(std::move(formatters)),
      settings_(std::move(settings)) {}

auto RunOrchestrator::run(const std::vector<std::string>& candidate_files,
                          const std::optional<std::filesystem::path>& cache_store)
    -> RunStatistics {
    require_initialized(formatters_);

    HashCache cache = cache_store ? HashCache::load(*cache_store, logger_) : HashCache{};
    FileProcessor processor(file_system_, logger_, settings_.processor);
    RunStatistics statistics;

    for (const auto& file : candidate_files) {
        if (!file_system_.file_exists(file)) {
            logger_.debug("File " + file + " does not exist");
            statistics.fail_count++;
            continue;
        }
        if (!file_system_.is_writable(file)) {
            logger_.debug("File " + file + " is read only");
            statistics.read_only_count++;
            continue;
        }

        try {
            auto outcome = processor.process(file, cache_key(file), cache, formatters_);
            logger_.debug(file + ": " + outcome_name(outcome));
            statistics.record(outcome);
        } catch (const IoError& e) {
            logger_.warn(e.what());
            statistics.record(FormatOutcome::FAIL);
        }
    }

    if (cache_store && !settings_.processor.dry_run) {
        if (!cache.persist(*cache_store)) {
            logger_.warn("Cannot store file hash cache properties file " + cache_store->string());
        }
    }

    return statistics;
}

auto RunOrchestrator::require_initialized(const FormatterList& formatters) -> void {
    bool any_initialized = std::any_of(formatters.begin(), formatters.end(),
                                       [](const auto& f) { return f->is_initialized(); });
    if (!any_initialized) {
        throw ConfigError("You must provide a Java or Javascript configuration file.");
    }
}

auto RunOrchestrator::cache_key(const std::string& path) const -> std::string {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        canonical = std::filesystem::absolute(path).lexically_normal();
    }
    auto base = std::filesystem::weakly_canonical(settings_.basedir, ec);
    if (ec) {
        base = std::filesystem::absolute(settings_.basedir).lexically_normal();
    }

    auto relative = canonical.lexically_relative(base);
    if (relative.empty() || *relative.begin() == "..") {
        return canonical.generic_string();
    }
    return relative.generic_string();
}

} // namespace srcfmt
