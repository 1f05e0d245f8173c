#include "richclip/build_info.h"

#include "richclip/build_info_generated.h"
#include "richclip/wire_format.h"

#include <initializer_list>

namespace richclip {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        RICHCLIP_BUILDINFO_VERSION,
        RICHCLIP_BUILDINFO_BUILD_TYPE,
        RICHCLIP_BUILDINFO_COMPILER,
        RICHCLIP_BUILDINFO_TARGET,
        RICHCLIP_BUILDINFO_CONFIGURED_AT_UTC,
        kProtocolVersion,
    };

    static void append_limit(std::string_view key, uint64_t value,
                             std::string* out)
    {
        if (!out->empty()) {
            out->push_back(' ');
        }
        out->append(key);
        out->push_back('=');
        if (value == 0U) {
            out->append("unlimited");
        } else {
            out->append(std::to_string(value));
        }
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_version_line(const BuildInfo& info, std::string* out) noexcept
{
    out->clear();
    out->append("richclip ");
    out->append(info.version);
    out->append(" (protocol ");
    out->append(std::to_string(static_cast<unsigned>(info.protocol_version)));
    for (std::string_view part : { info.build_type, info.compiler, info.target,
                                   info.configured_at_utc }) {
        if (part.empty()) {
            continue;
        }
        out->append("; ");
        out->append(part);
    }
    out->push_back(')');
}


void
format_limits_line(const BulkDecodeLimits& limits, std::string* out) noexcept
{
    out->clear();
    append_limit("sections", limits.max_sections, out);
    append_limit("items", limits.max_items, out);
    append_limit("mime_types_per_item", limits.max_mime_types_per_item, out);
    append_limit("mime_type_bytes", limits.max_mime_type_bytes, out);
    append_limit("content_bytes", limits.max_content_bytes, out);
    append_limit("total_bytes", limits.max_total_bytes, out);
}

}  // namespace richclip
