#pragma once

#include "srcfmt/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace srcfmt::line_endings {

// Parse AUTO/KEEP/LF/CRLF/CR (case-insensitive), throws ConfigError
auto parse(std::string_view name) -> LineEnding;
auto name(LineEnding ending) -> std::string;

// Separator of the running platform
auto native_separator() -> std::string;

// Characters written for a fixed policy (LF, CRLF, CR); native separator for AUTO and KEEP
auto separator(LineEnding ending) -> std::string;

// The single separator style used throughout text, std::nullopt when mixed or absent
auto detect(std::string_view text) -> std::optional<LineEnding>;

// Separator to write for text under the given policy
auto resolve_separator(LineEnding policy, std::string_view text) -> std::string;

} // namespace srcfmt::line_endings
