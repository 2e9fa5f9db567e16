#pragma once

#include "srcfmt/types.hpp"
#include <string>
#include <string_view>

namespace srcfmt::encodings {

// Parse an encoding name (UTF-8, US-ASCII, ISO-8859-1 and common aliases), throws ConfigError
auto parse(std::string_view name) -> Encoding;
auto name(Encoding encoding) -> std::string;

// Encoding used when none is configured
auto platform_default() -> Encoding;

// True if every byte sequence in text is legal in the encoding
auto is_valid(std::string_view text, Encoding encoding) -> bool;

} // namespace srcfmt::encodings
