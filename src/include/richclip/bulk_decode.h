#pragma once

#include "richclip/byte_source.h"
#include "richclip/data_item.h"
#include "richclip/decode_status.h"

#include <cstdint>
#include <vector>

/**
 * \file bulk_decode.h
 * \brief Decoder for self-describing multi-section richclip streams.
 */

namespace richclip {

/**
 * \brief Resource limits applied during bulk decode.
 *
 * A value of 0 disables the corresponding check. The defaults accept every
 * stream \ref encode_bulk can produce; callers decoding untrusted input
 * should take their budgets from \ref ResourcePolicy instead.
 */
struct BulkDecodeLimits final {
    uint32_t max_sections            = 0;
    uint32_t max_items               = 0;
    uint32_t max_mime_types_per_item = 0;
    uint32_t max_mime_type_bytes     = 0;
    uint32_t max_content_bytes       = 0;
    uint64_t max_total_bytes         = 0;
};

/// Decoder options for \ref decode_bulk.
struct BulkDecodeOptions final {
    BulkDecodeLimits limits;
};

/**
 * \brief Decodes a bulk stream from \p source into \p out.
 *
 * The stream is `header, section*`. Each 'M' section appends one label to a
 * pending list; each 'C' section turns the pending labels and its payload
 * into one \ref DataItem. The stream may only end at a section boundary.
 * Labels still pending at end-of-stream are dropped without error and
 * counted in \ref DecodeResult::pending_mime_types_dropped.
 *
 * Decoding is all-or-nothing: \p out is replaced on success and cleared on
 * failure.
 */
DecodeResult
decode_bulk(ByteSource& source, std::vector<DataItem>* out,
            const BulkDecodeOptions& options = BulkDecodeOptions {}) noexcept;

}  // namespace richclip
