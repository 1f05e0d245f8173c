#include "richclip/build_info.h"
#include "richclip/bulk_decode.h"
#include "richclip/byte_source.h"
#include "richclip/console_format.h"
#include "richclip/oneshot_decode.h"
#include "richclip/resource_policy.h"
#include "richclip/utf8.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace richclip {
namespace {

    struct DumpOptions final {
        bool oneshot         = false;
        bool verbose         = false;
        bool show_build_info = true;
        uint32_t max_bytes   = 64;
        std::vector<std::string> mime_types;
        ResourcePolicy policy;
    };

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end       = nullptr;
        unsigned long v = std::strtoul(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        if (v > 0xFFFFFFFFUL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] [file...]\n", argv0);
        std::printf("reads stdin when no file (or `-`) is given\n");
        std::printf("options:\n");
        std::printf("  --version                print build info and exit\n");
        std::printf("  --no-build-info          hide build info header\n");
        std::printf("  --oneshot                treat each input as one untyped payload\n");
        std::printf("  -t, --type MIME          MIME type for --oneshot (repeatable)\n");
        std::printf("  --verbose                print decode diagnostics\n");
        std::printf(
            "  --max-bytes N            max content bytes to preview (default: 64; 0=all)\n");
        std::printf(
            "  --max-section-bytes N    refuse bulk content sections larger than N bytes\n"
            "                           (bulk only; --oneshot is bounded by --max-input-bytes)\n");
        std::printf(
            "  --max-input-bytes N      refuse inputs larger than N bytes (0=unlimited)\n");
    }

    static void print_version_line()
    {
        std::string line;
        format_version_line(build_info(), &line);
        std::printf("%s\n", line.c_str());
    }

    static void print_limits_line(const DumpOptions& options)
    {
        std::string line;
        if (options.oneshot) {
            const uint64_t max
                = options.policy.oneshot_limits.max_content_bytes;
            line = max == 0U ? "content_bytes=unlimited"
                             : "content_bytes=" + std::to_string(max);
        } else {
            format_limits_line(options.policy.bulk_limits, &line);
        }
        std::printf("limits: %s\n", line.c_str());
    }

    static void print_item(uint32_t index, const DataItem& item,
                           uint32_t max_bytes)
    {
        std::string line;
        append_mime_type_list(item.mime_types, 0, &line);
        std::printf("item[%u] mime_types=%s size=%zu\n", index, line.c_str(),
                    item.content.size());

        line.clear();
        if (is_valid_utf8(item.content)) {
            line.append("  text=\"");
            (void)append_console_escaped_ascii(
                std::string_view(reinterpret_cast<const char*>(
                                     item.content.data()),
                                 item.content.size()),
                max_bytes, &line);
            line.push_back('"');
        } else {
            line.append("  hex=");
            append_hex_bytes(item.content, max_bytes, ' ', &line);
        }
        std::printf("%s\n", line.c_str());
    }

    static void print_failure(const char* name, const DecodeResult& r)
    {
        std::fprintf(stderr,
                     "clipdump: `%s`: %s field=%s offset=%llu",
                     name, decode_status_name(r.status).data(),
                     decode_field_name(r.field).data(),
                     static_cast<unsigned long long>(r.offset));
        if (r.status == DecodeStatus::UnknownSectionTag) {
            std::fprintf(stderr, " tag=0x%02X", static_cast<unsigned>(r.tag));
        }
        if (r.status == DecodeStatus::UnsupportedVersion) {
            std::fprintf(stderr, " version=%u",
                         static_cast<unsigned>(r.version));
        }
        if (r.field == DecodeField::MimeTypePayload
            || r.field == DecodeField::ContentPayload
            || r.status == DecodeStatus::LimitExceeded) {
            std::fprintf(stderr, " declared_length=%u",
                         static_cast<unsigned>(r.declared_length));
        }
        std::fputc('\n', stderr);
    }

    static int dump_source(const char* name, ByteSource& source,
                           const DumpOptions& options)
    {
        std::vector<DataItem> items;
        DecodeResult r;
        if (options.oneshot) {
            OneshotDecodeOptions oneshot;
            apply_resource_policy(options.policy, nullptr, &oneshot);
            r = decode_oneshot(source, options.mime_types, &items, oneshot);
        } else {
            BulkDecodeOptions bulk;
            apply_resource_policy(options.policy, &bulk, nullptr);
            r = decode_bulk(source, &items, bulk);
        }

        std::printf("== %s\n", name);
        if (options.verbose) {
            std::printf(
                "status=%s mode=%s bytes=%llu sections=%u items=%u dropped_mime_types=%u\n",
                decode_status_name(r.status).data(),
                options.oneshot ? "oneshot" : "bulk",
                static_cast<unsigned long long>(r.bytes_consumed),
                r.sections_decoded, r.items_decoded,
                r.pending_mime_types_dropped);
        }
        if (r.status != DecodeStatus::Ok) {
            print_failure(name, r);
            return 1;
        }

        for (size_t i = 0; i < items.size(); ++i) {
            print_item(static_cast<uint32_t>(i), items[i], options.max_bytes);
        }
        return 0;
    }

}  // namespace
}  // namespace richclip

int
main(int argc, char** argv)
{
    using namespace richclip;

    DumpOptions options;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_version_line();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            options.show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--oneshot") == 0) {
            options.oneshot = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--verbose") == 0) {
            options.verbose = true;
            first_path += 1;
            continue;
        }
        if ((std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--type") == 0)
            && i + 1 < argc) {
            options.mime_types.emplace_back(argv[i + 1]);
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            options.max_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-section-bytes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-section-bytes value\n");
                return 2;
            }
            options.policy.bulk_limits.max_content_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-input-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-input-bytes value\n");
                return 2;
            }
            options.policy.bulk_limits.max_total_bytes     = v;
            options.policy.oneshot_limits.max_content_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (options.oneshot && options.mime_types.empty()) {
        std::fprintf(stderr, "clipdump: --oneshot requires at least one -t MIME\n");
        return 2;
    }

    if (options.show_build_info) {
        print_version_line();
    }
    if (options.verbose) {
        print_limits_line(options);
    }

    if (first_path >= argc) {
        FdByteSource in = FdByteSource::borrow(STDIN_FILENO);
        return dump_source("-", in, options);
    }

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }

        if (std::strcmp(path, "-") == 0) {
            FdByteSource in = FdByteSource::borrow(STDIN_FILENO);
            exit_code |= dump_source(path, in, options);
            continue;
        }

        FdByteSource file;
        if (file.open_file(path) != FdOpenStatus::Ok) {
            std::fprintf(stderr, "clipdump: failed to open `%s`\n", path);
            exit_code = 1;
            continue;
        }
        exit_code |= dump_source(path, file, options);
    }

    return exit_code;
}
