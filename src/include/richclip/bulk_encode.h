#pragma once

#include "richclip/data_item.h"
#include "richclip/wire_format.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file bulk_encode.h
 * \brief Encoder producing bulk streams accepted by \ref decode_bulk.
 */

namespace richclip {

/// Encode result status.
enum class EncodeStatus : uint8_t {
    Ok,
    /// An item has no MIME-type labels.
    EmptyMimeTypes,
    /// A MIME-type label is not valid UTF-8.
    InvalidEncoding,
    /// A payload does not fit a u32 length, or the output cap was hit.
    LimitExceeded,
};

struct EncodeOptions final {
    /// Maximum encoded stream size (0 = unlimited).
    uint64_t max_output_bytes = 0;
};

struct EncodeResult final {
    EncodeStatus status = EncodeStatus::Ok;
    /// Index of the item that caused a failure.
    uint32_t failed_item = 0;
    uint32_t items_encoded = 0;
    uint64_t bytes_written = 0;
};

/**
 * \brief Appends the stream header and one 'M' section per label plus one
 * 'C' section per item to \p out.
 *
 * \p out is left unchanged on failure.
 */
EncodeResult
encode_bulk(std::span<const DataItem> items, std::vector<std::byte>* out,
            const EncodeOptions& options = EncodeOptions {}) noexcept;

/// Appends `[magic][version]` to \p out.
void
append_stream_header(std::vector<std::byte>* out) noexcept;

/**
 * \brief Appends one `[tag][u32be length][payload]` section.
 *
 * \p tag is written as-is, so callers can also produce malformed streams.
 * Returns false (and writes nothing) if the payload exceeds 0xFFFFFFFF bytes.
 */
bool
append_section(uint8_t tag, std::span<const std::byte> payload,
               std::vector<std::byte>* out) noexcept;

}  // namespace richclip
