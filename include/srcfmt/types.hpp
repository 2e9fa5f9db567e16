#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace srcfmt {

// Terminal result of one file's trip through the pipeline
enum class FormatOutcome {
    SUCCESS,  // File rewritten (or would be, in dry-run mode)
    FAIL,     // Unreadable, unformattable or unwritable
    SKIPPED   // Cache hit, no formatter, or already canonical
};

// Line separator written to formatted files
enum class LineEnding {
    AUTO,  // Native separator of the running platform
    KEEP,  // Separator already used by the file, AUTO when mixed or absent
    LF,    // Unix/Linux/macOS
    CRLF,  // Windows
    CR     // Classic Mac OS
};

// Text encodings the pipeline can validate
enum class Encoding {
    UTF8,
    US_ASCII,
    ISO_8859_1
};

// Formatter option set as read from a configuration file
using FormatterOptions = std::map<std::string, std::string>;

// Global settings shared by every formatter of a run
struct Configuration {
    std::string compiler_source = "1.5";
    std::string compiler_compliance = "1.5";
    std::string compiler_target = "1.5";
    std::string target_directory = "target";
    Encoding encoding = Encoding::UTF8;
    LineEnding line_ending = LineEnding::AUTO;
};

// Per-run counters, each file lands in exactly one of them
struct RunStatistics {
    size_t success_count{};
    size_t fail_count{};
    size_t skipped_count{};
    size_t read_only_count{};

    auto record(FormatOutcome outcome) -> void;
    auto total() const -> size_t;

    auto operator==(const RunStatistics& other) const -> bool = default;
};

// Where imports that match no configured group are emitted
enum class UnmatchedImports {
    LAST,
    FIRST
};

// Ordered import group prefixes used by the Java formatter
struct ImportOrder {
    std::vector<std::string> groups;
    UnmatchedImports unmatched = UnmatchedImports::LAST;
};

auto outcome_name(FormatOutcome outcome) -> std::string;

} // namespace srcfmt
