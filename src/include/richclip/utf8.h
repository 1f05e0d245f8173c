#pragma once

#include <cstddef>
#include <span>

namespace richclip {

/**
 * \brief Returns true when \p bytes is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogate code points (U+D800..U+DFFF), code
 * points above U+10FFFF and truncated sequences. An empty span is valid.
 */
bool
is_valid_utf8(std::span<const std::byte> bytes) noexcept;

}  // namespace richclip
