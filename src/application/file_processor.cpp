#include "srcfmt/application/file_processor.hpp"
#include "srcfmt/core/digest.hpp"
#include "srcfmt/core/encoding.hpp"
#include "srcfmt/errors.hpp"
#include <filesystem>

namespace srcfmt {

FileProcessor::FileProcessor(IFileSystem& file_system, ILogger& logger, ProcessorSettings settings)
    : file_system_(file_system), logger_(logger), settings_(settings) {}

auto FileProcessor::process(const std::string& path, const std::string& cache_key,
                            HashCache& cache, const FormatterList& formatters) -> FormatOutcome {
    logger_.debug("Processing file: " + path);

    auto code = file_system_.read_file(path);
    if (!encodings::is_valid(code, settings_.encoding)) {
        throw IoError("File " + path + " is not valid " + encodings::name(settings_.encoding));
    }
    auto original_hash = digest::sha512_hex(code);

    auto cached_hash = cache.get(cache_key);
    if (cached_hash && *cached_hash == original_hash) {
        logger_.debug("File is already formatted.");
        return FormatOutcome::SKIPPED;
    }

    auto* formatter = select_formatter(path, formatters);
    if (formatter == nullptr) {
        logger_.debug("No formatter configured for " + path);
        return FormatOutcome::SKIPPED;
    }

    std::optional<std::string> formatted;
    try {
        formatted = formatter->format(code, settings_.line_ending);
    } catch (const FormatError& e) {
        logger_.warn(path + ": " + e.what());
        return FormatOutcome::FAIL;
    }

    if (!formatted) {
        // Already canonical, remember it so the next run skips the formatter
        cache.put(cache_key, original_hash);
        logger_.debug("Code is already in canonical form.");
        return FormatOutcome::SKIPPED;
    }

    auto formatted_hash = digest::sha512_hex(*formatted);
    if (formatted_hash == original_hash) {
        cache.put(cache_key, original_hash);
        logger_.debug("Equal hash code. Not writing result to file.");
        return FormatOutcome::SKIPPED;
    }

    if (settings_.dry_run) {
        logger_.info("Would reformat " + path);
        return FormatOutcome::SUCCESS;
    }

    try {
        file_system_.write_file(path, *formatted);
    } catch (const IoError& e) {
        logger_.warn(e.what());
        return FormatOutcome::FAIL;
    }

    cache.put(cache_key, formatted_hash);
    return FormatOutcome::SUCCESS;
}

auto FileProcessor::select_formatter(const std::string& path, const FormatterList& formatters)
    -> IFormatter* {
    std::filesystem::path file(path);
    for (const auto& formatter : formatters) {
        if (formatter->handles(file)) {
            return formatter->is_initialized() ? formatter.get() : nullptr;
        }
    }
    return nullptr;
}

} // namespace srcfmt
