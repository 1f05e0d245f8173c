#include "richclip/oneshot_decode.h"

#include "richclip/stream_reader.h"

#include <utility>

namespace richclip {

DecodeResult
decode_oneshot(ByteSource& source,
               std::span<const std::string> candidate_mime_types,
               std::vector<DataItem>* out,
               const OneshotDecodeOptions& options) noexcept
{
    DecodeResult result;
    if (out) {
        out->clear();
    }

    StreamReader reader(source);
    DataItem item;

    result.field = DecodeField::OneshotContent;
    result.status
        = reader.read_to_end(options.limits.max_content_bytes, &item.content);
    result.bytes_consumed = reader.offset();
    if (result.status != DecodeStatus::Ok) {
        return result;
    }
    result.field = DecodeField::None;

    for (const std::string& mime_type : candidate_mime_types) {
        if (!mime_type.empty()) {
            item.mime_types.push_back(mime_type);
        }
    }
    if (item.mime_types.empty()) {
        result.status = DecodeStatus::NoValidMimeType;
        return result;
    }

    result.sections_decoded = 1;
    result.items_decoded    = 1;
    if (out) {
        out->push_back(std::move(item));
    }
    return result;
}

}  // namespace richclip
