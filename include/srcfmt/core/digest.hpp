#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace srcfmt::digest {

// Length of a hex-encoded SHA-512 digest
inline constexpr size_t hex_length = 128;

// Lowercase hex SHA-512 of the given bytes
auto sha512_hex(std::string_view bytes) -> std::string;

// True if text looks like a value produced by sha512_hex
auto is_hex_digest(std::string_view text) -> bool;

} // namespace srcfmt::digest
