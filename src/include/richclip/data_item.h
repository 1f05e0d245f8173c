#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * \file data_item.h
 * \brief Decoded unit: MIME-type labels plus one content payload.
 */

namespace richclip {

/**
 * \brief One typed payload.
 *
 * `mime_types` is never empty for items produced by the decoders; labels keep
 * declaration order and duplicates are preserved. `content` may be empty.
 */
struct DataItem final {
    std::vector<std::string> mime_types;
    std::vector<std::byte> content;
};

inline bool
operator==(const DataItem& a, const DataItem& b) noexcept
{
    return a.mime_types == b.mime_types && a.content == b.content;
}

}  // namespace richclip
