#include "richclip/decode_status.h"

namespace richclip {

std::string_view
decode_status_name(DecodeStatus status) noexcept
{
    switch (status) {
    case DecodeStatus::Ok: return "ok";
    case DecodeStatus::BadMagic: return "bad_magic";
    case DecodeStatus::UnsupportedVersion: return "unsupported_version";
    case DecodeStatus::TruncatedInput: return "truncated_input";
    case DecodeStatus::InvalidEncoding: return "invalid_encoding";
    case DecodeStatus::ContentWithoutMimeType:
        return "content_without_mime_type";
    case DecodeStatus::UnknownSectionTag: return "unknown_section_tag";
    case DecodeStatus::NoValidMimeType: return "no_valid_mime_type";
    case DecodeStatus::LimitExceeded: return "limit_exceeded";
    case DecodeStatus::IoFailed: return "io_failed";
    }
    return "unknown";
}


std::string_view
decode_field_name(DecodeField field) noexcept
{
    switch (field) {
    case DecodeField::None: return "none";
    case DecodeField::Magic: return "magic";
    case DecodeField::Version: return "version";
    case DecodeField::SectionTag: return "section_tag";
    case DecodeField::SectionLength: return "section_length";
    case DecodeField::MimeTypePayload: return "mime_type_payload";
    case DecodeField::ContentPayload: return "content_payload";
    case DecodeField::OneshotContent: return "oneshot_content";
    }
    return "unknown";
}

}  // namespace richclip
