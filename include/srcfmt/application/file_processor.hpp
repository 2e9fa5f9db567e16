#pragma once

#include "srcfmt/core/hash_cache.hpp"
#include "srcfmt/interfaces.hpp"
#include "srcfmt/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace srcfmt {

struct ProcessorSettings {
    LineEnding line_ending = LineEnding::AUTO;
    Encoding encoding = Encoding::UTF8;
    bool dry_run = false;
};

using FormatterList = std::vector<std::unique_ptr<IFormatter>>;

// Per-file pipeline: read, digest, cache check, format, conditional rewrite, cache update
class FileProcessor {
public:
    FileProcessor(IFileSystem& file_system, ILogger& logger, ProcessorSettings settings);

    // Read failures (IoError) propagate to the caller. Format and write failures are
    // reported as FAIL and leave the cache entry untouched.
    auto process(const std::string& path, const std::string& cache_key, HashCache& cache,
                 const FormatterList& formatters) -> FormatOutcome;

    // First initialized formatter handling the path, nullptr if none
    static auto select_formatter(const std::string& path, const FormatterList& formatters)
        -> IFormatter*;

private:
    IFileSystem& file_system_;
    ILogger& logger_;
    ProcessorSettings settings_;
};

} // namespace srcfmt
