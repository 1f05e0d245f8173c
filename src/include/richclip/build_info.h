#pragma once

#include "richclip/bulk_decode.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version and configuration lines printed by the tools.
 */

namespace richclip {

/// Compiled-in description of this richclip build.
struct BuildInfo final {
    std::string_view version;
    /// CMake build type, or "multi-config".
    std::string_view build_type;
    /// `<compiler id> <compiler version>`.
    std::string_view compiler;
    /// `<system>-<processor>` the library was configured for.
    std::string_view target;
    /// UTC configure time; may be empty.
    std::string_view configured_at_utc;
    uint8_t protocol_version = 0;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Writes `richclip <version> (protocol <N>; <build type>; ...)`.
 *
 * Empty fields of \p info are skipped.
 */
void
format_version_line(const BuildInfo& info, std::string* out) noexcept;

/// Writes \p limits as `key=value` pairs; disabled checks read `unlimited`.
void
format_limits_line(const BulkDecodeLimits& limits, std::string* out) noexcept;

}  // namespace richclip
