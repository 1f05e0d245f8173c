#pragma once

#include "richclip/bulk_decode.h"
#include "richclip/bulk_encode.h"
#include "richclip/oneshot_decode.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for decoding untrusted richclip streams.
 */

namespace richclip {

/// Bulk budgets for streams from an untrusted peer.
inline BulkDecodeLimits
untrusted_bulk_limits() noexcept
{
    BulkDecodeLimits limits;
    limits.max_sections            = 1000000;
    limits.max_items               = 100000;
    limits.max_mime_types_per_item = 1024;
    limits.max_mime_type_bytes     = 4096;
    limits.max_content_bytes       = 512U * 1024U * 1024U;
    limits.max_total_bytes         = 2ULL * 1024ULL * 1024ULL * 1024ULL;
    return limits;
}

/**
 * \brief Storage-agnostic resource limits for untrusted input.
 *
 * The decoders never allocate more than one section ahead of the data they
 * have actually received, but a peer can still stream large declared
 * sections. These budgets cap what a single call may accept.
 */
struct ResourcePolicy final {
    /// Bulk section/item budgets.
    BulkDecodeLimits bulk_limits = untrusted_bulk_limits();

    /// Oneshot content budget.
    OneshotDecodeLimits oneshot_limits;

    /// Encoder output cap (0 = unlimited).
    uint64_t max_encoded_bytes = 0;
};

inline void
apply_resource_policy(const ResourcePolicy& policy, BulkDecodeOptions* bulk,
                      OneshotDecodeOptions* oneshot) noexcept
{
    if (bulk) {
        bulk->limits = policy.bulk_limits;
    }
    if (oneshot) {
        oneshot->limits = policy.oneshot_limits;
    }
}

inline void
apply_resource_policy(const ResourcePolicy& policy,
                      EncodeOptions* encode) noexcept
{
    if (encode) {
        encode->max_output_bytes = policy.max_encoded_bytes;
    }
}

}  // namespace richclip
