#pragma once

#include "richclip/byte_source.h"
#include "richclip/data_item.h"
#include "richclip/decode_status.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file oneshot_decode.h
 * \brief Whole-stream decoder with caller-supplied MIME types.
 */

namespace richclip {

struct OneshotDecodeLimits final {
    /// Maximum content size (0 = unlimited).
    uint64_t max_content_bytes = 512ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_oneshot.
struct OneshotDecodeOptions final {
    OneshotDecodeLimits limits;
};

/**
 * \brief Reads \p source to end-of-stream as one content payload.
 *
 * Empty strings in \p candidate_mime_types are skipped (order of the rest is
 * kept); if none remain the call fails with `NoValidMimeType`. On success
 * \p out holds exactly one \ref DataItem; on failure it is cleared.
 */
DecodeResult
decode_oneshot(ByteSource& source,
               std::span<const std::string> candidate_mime_types,
               std::vector<DataItem>* out,
               const OneshotDecodeOptions& options
               = OneshotDecodeOptions {}) noexcept;

}  // namespace richclip
