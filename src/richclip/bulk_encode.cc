#include "richclip/bulk_encode.h"

#include "richclip/utf8.h"

#include <limits>
#include <string>

namespace richclip {
namespace {

    static std::span<const std::byte> as_bytes(const std::string& s) noexcept
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(s.data()), s.size());
    }

    static bool fits_u32(size_t n) noexcept
    {
        return static_cast<uint64_t>(n) <= std::numeric_limits<uint32_t>::max();
    }

    static EncodeStatus check_item(const DataItem& item,
                                   uint64_t* encoded_bytes) noexcept
    {
        if (item.mime_types.empty()) {
            return EncodeStatus::EmptyMimeTypes;
        }
        uint64_t n = 0;
        for (const std::string& mime_type : item.mime_types) {
            if (!fits_u32(mime_type.size())) {
                return EncodeStatus::LimitExceeded;
            }
            if (!is_valid_utf8(as_bytes(mime_type))) {
                return EncodeStatus::InvalidEncoding;
            }
            n += kSectionTagBytes + kSectionLengthBytes + mime_type.size();
        }
        if (!fits_u32(item.content.size())) {
            return EncodeStatus::LimitExceeded;
        }
        n += kSectionTagBytes + kSectionLengthBytes + item.content.size();
        *encoded_bytes = n;
        return EncodeStatus::Ok;
    }

}  // namespace

void
append_stream_header(std::vector<std::byte>* out) noexcept
{
    out->insert(out->end(), kStreamMagic.begin(), kStreamMagic.end());
    out->push_back(static_cast<std::byte>(kProtocolVersion));
}


bool
append_section(uint8_t tag, std::span<const std::byte> payload,
               std::vector<std::byte>* out) noexcept
{
    if (!fits_u32(payload.size())) {
        return false;
    }
    std::byte len[kSectionLengthBytes] = {};
    store_u32be(static_cast<uint32_t>(payload.size()), len);

    out->push_back(static_cast<std::byte>(tag));
    out->insert(out->end(), len, len + kSectionLengthBytes);
    out->insert(out->end(), payload.begin(), payload.end());
    return true;
}


EncodeResult
encode_bulk(std::span<const DataItem> items, std::vector<std::byte>* out,
            const EncodeOptions& options) noexcept
{
    EncodeResult result;

    // Validate and size everything first so a failure leaves `out` untouched.
    uint64_t total = kHeaderBytes;
    for (size_t i = 0; i < items.size(); ++i) {
        uint64_t n            = 0;
        const EncodeStatus st = check_item(items[i], &n);
        if (st != EncodeStatus::Ok) {
            result.status      = st;
            result.failed_item = static_cast<uint32_t>(i);
            return result;
        }
        total += n;
        if (options.max_output_bytes != 0U
            && total > options.max_output_bytes) {
            result.status      = EncodeStatus::LimitExceeded;
            result.failed_item = static_cast<uint32_t>(i);
            return result;
        }
    }

    out->reserve(out->size() + static_cast<size_t>(total));
    append_stream_header(out);
    for (const DataItem& item : items) {
        for (const std::string& mime_type : item.mime_types) {
            (void)append_section(static_cast<uint8_t>(SectionTag::MimeType),
                                 as_bytes(mime_type), out);
        }
        (void)append_section(static_cast<uint8_t>(SectionTag::Content),
                             item.content, out);
        result.items_encoded += 1;
    }
    result.bytes_written = total;
    return result;
}

}  // namespace richclip
