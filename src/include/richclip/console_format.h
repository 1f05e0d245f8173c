#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace richclip {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`, `\\` and `"`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends uppercase hex bytes into `out` (no "0x" prefix), separated by
// `separator` unless it is '\0'.
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 char separator, std::string* out) noexcept;

// Appends `["a", "b"]` with every label escaped.
void
append_mime_type_list(std::span<const std::string> mime_types,
                      uint32_t max_label_bytes, std::string* out) noexcept;

}  // namespace richclip
