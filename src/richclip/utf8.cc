#include "richclip/utf8.h"

#include <cstdint>

namespace richclip {

bool
is_valid_utf8(std::span<const std::byte> bytes) noexcept
{
    size_t i = 0U;
    while (i < bytes.size()) {
        const uint8_t b0 = static_cast<uint8_t>(bytes[i]);
        size_t len       = 0U;

        if (b0 <= 0x7FU) {
            i += 1U;
            continue;
        }
        if (b0 >= 0xC2U && b0 <= 0xDFU) {
            len = 2U;
        } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
            len = 3U;
        } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
            len = 4U;
        } else {
            return false;
        }

        if (i + len > bytes.size()) {
            return false;
        }

        // Second byte carries the overlong/surrogate/range constraints.
        const uint8_t b1 = static_cast<uint8_t>(bytes[i + 1U]);
        if ((b1 & 0xC0U) != 0x80U) {
            return false;
        }
        if ((b0 == 0xE0U && b1 < 0xA0U) || (b0 == 0xEDU && b1 >= 0xA0U)
            || (b0 == 0xF0U && b1 < 0x90U) || (b0 == 0xF4U && b1 >= 0x90U)) {
            return false;
        }

        for (size_t j = 2U; j < len; ++j) {
            const uint8_t bj = static_cast<uint8_t>(bytes[i + j]);
            if ((bj & 0xC0U) != 0x80U) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

}  // namespace richclip
