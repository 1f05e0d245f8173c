#pragma once

#include <cstdint>
#include <string_view>

/**
 * \file decode_status.h
 * \brief Status and diagnostics shared by the bulk and oneshot decoders.
 */

namespace richclip {

/// Decode result status.
enum class DecodeStatus : uint8_t {
    Ok,
    /// The first 4 bytes are not the stream magic.
    BadMagic,
    /// The version byte is not \ref kProtocolVersion.
    UnsupportedVersion,
    /// End-of-stream inside a header field, length prefix or payload.
    TruncatedInput,
    /// A MIME-type payload is not valid UTF-8.
    InvalidEncoding,
    /// A content section was not preceded by a MIME-type section.
    ContentWithoutMimeType,
    /// A section tag is neither 'M' nor 'C'.
    UnknownSectionTag,
    /// Oneshot mode: every candidate label was empty.
    NoValidMimeType,
    /// A configured resource limit was exceeded.
    LimitExceeded,
    /// The byte source reported a read error.
    IoFailed,
};

/// Field that was being read when decoding stopped.
enum class DecodeField : uint8_t {
    None,
    Magic,
    Version,
    SectionTag,
    SectionLength,
    MimeTypePayload,
    ContentPayload,
    OneshotContent,
};

struct DecodeResult final {
    DecodeStatus status = DecodeStatus::Ok;
    DecodeField field   = DecodeField::None;

    /// Stream offset where the failing field starts.
    uint64_t offset = 0;
    /// Total bytes consumed from the source.
    uint64_t bytes_consumed = 0;

    /// Offending tag byte (valid for `UnknownSectionTag`).
    uint8_t tag = 0;
    /// Version byte found in the header.
    uint8_t version = 0;
    /// Length prefix of the failing section, when it was read.
    uint32_t declared_length = 0;

    uint32_t sections_decoded = 0;
    uint32_t items_decoded    = 0;
    /// MIME-type labels left without a content section at end-of-stream.
    uint32_t pending_mime_types_dropped = 0;
};

/// Stable lowercase name (e.g. "bad_magic").
std::string_view
decode_status_name(DecodeStatus status) noexcept;

/// Stable lowercase name (e.g. "section_length").
std::string_view
decode_field_name(DecodeField field) noexcept;

}  // namespace richclip
