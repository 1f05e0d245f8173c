#include "richclip/console_format.h"

#include <cstdio>

namespace richclip {
namespace {

    static uint32_t clamp_count(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return static_cast<uint32_t>(size);
        }
        return max_bytes;
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool escaped     = false;
    const uint32_t n = clamp_count(s.size(), max_bytes);

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n': out->append("\\n"); escaped = true; continue;
        case '\r': out->append("\\r"); escaped = true; continue;
        case '\t': out->append("\\t"); escaped = true; continue;
        default: break;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 char separator, std::string* out) noexcept
{
    const uint32_t n = clamp_count(bytes.size(), max_bytes);

    out->reserve(out->size() + static_cast<size_t>(n) * 3U);
    for (uint32_t i = 0; i < n; ++i) {
        if (i != 0U && separator != '\0') {
            out->push_back(separator);
        }
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%02X",
                      static_cast<unsigned>(static_cast<uint8_t>(bytes[i])));
        out->append(buf);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


void
append_mime_type_list(std::span<const std::string> mime_types,
                      uint32_t max_label_bytes, std::string* out) noexcept
{
    out->push_back('[');
    for (size_t i = 0; i < mime_types.size(); ++i) {
        if (i != 0U) {
            out->append(", ");
        }
        out->push_back('"');
        (void)append_console_escaped_ascii(mime_types[i], max_label_bytes, out);
        out->push_back('"');
    }
    out->push_back(']');
}

}  // namespace richclip
