#include "richclip/build_info.h"
#include "richclip/bulk_encode.h"
#include "richclip/byte_source.h"
#include "richclip/resource_policy.h"
#include "richclip/stream_reader.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace richclip {
namespace {

    static const char* encode_status_name(EncodeStatus status) noexcept
    {
        switch (status) {
        case EncodeStatus::Ok: return "ok";
        case EncodeStatus::EmptyMimeTypes: return "empty_mime_types";
        case EncodeStatus::InvalidEncoding: return "invalid_encoding";
        case EncodeStatus::LimitExceeded: return "limit_exceeded";
        }
        return "unknown";
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
        std::printf("usage: %s [options] (-t MIME... (-i FILE | -s TEXT))...\n",
                    argv0);
        std::printf("writes a bulk stream; each -i/-s closes one item with the\n");
        std::printf("MIME types given since the previous one\n");
        std::printf("options:\n");
        std::printf("  --version                print build info and exit\n");
        std::printf("  -o FILE                  output file (default: stdout)\n");
        std::printf("  -t, --type MIME          add a MIME type to the next item\n");
        std::printf("  -i, --input FILE         content from FILE (`-` = stdin)\n");
        std::printf("  -s, --string TEXT        content from the argument itself\n");
        std::printf(
            "  --max-file-bytes N       refuse inputs larger than N bytes (default: 536870912; 0=unlimited)\n");
        std::printf(
            "  --max-output-bytes N     refuse to write streams larger than N bytes (0=unlimited)\n");
    }

    static bool read_content(const char* path, uint64_t max_file_bytes,
                             std::vector<std::byte>* out)
    {
        FdByteSource source;
        if (std::strcmp(path, "-") == 0) {
            source = FdByteSource::borrow(STDIN_FILENO);
        } else if (source.open_file(path) != FdOpenStatus::Ok) {
            std::fprintf(stderr, "clippack: failed to open `%s`\n", path);
            return false;
        }

        StreamReader reader(source);
        const DecodeStatus st = reader.read_to_end(max_file_bytes, out);
        if (st == DecodeStatus::LimitExceeded) {
            std::fprintf(stderr,
                         "clippack: refusing to read `%s` (> --max-file-bytes=%llu)\n",
                         path, static_cast<unsigned long long>(max_file_bytes));
            return false;
        }
        if (st != DecodeStatus::Ok) {
            std::fprintf(stderr, "clippack: failed to read `%s`\n", path);
            return false;
        }
        return true;
    }

    static bool write_all(std::FILE* f, const std::vector<std::byte>& bytes)
    {
        if (bytes.empty()) {
            return true;
        }
        const size_t n = std::fwrite(bytes.data(), 1, bytes.size(), f);
        return n == bytes.size() && std::fflush(f) == 0;
    }

}  // namespace
}  // namespace richclip

int
main(int argc, char** argv)
{
    using namespace richclip;

    const char* out_path    = nullptr;
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;
    ResourcePolicy policy;
    std::vector<DataItem> items;
    DataItem pending;

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
            std::string line;
            format_version_line(build_info(), &line);
            std::printf("%s\n", line.c_str());
            return 0;
        }
        if (i + 1 >= argc) {
            std::fprintf(stderr, "clippack: missing value for `%s`\n", arg);
            return 2;
        }
        const char* value = argv[i + 1];
        i += 1;

        if (std::strcmp(arg, "-o") == 0) {
            out_path = value;
        } else if (std::strcmp(arg, "-t") == 0
                   || std::strcmp(arg, "--type") == 0) {
            pending.mime_types.emplace_back(value);
        } else if (std::strcmp(arg, "-i") == 0
                   || std::strcmp(arg, "--input") == 0) {
            if (!read_content(value, max_file_bytes, &pending.content)) {
                return 1;
            }
            items.push_back(std::move(pending));
            pending = DataItem {};
        } else if (std::strcmp(arg, "-s") == 0
                   || std::strcmp(arg, "--string") == 0) {
            const size_t n = std::strlen(value);
            pending.content.assign(reinterpret_cast<const std::byte*>(value),
                                   reinterpret_cast<const std::byte*>(value)
                                       + n);
            items.push_back(std::move(pending));
            pending = DataItem {};
        } else if (std::strcmp(arg, "--max-file-bytes") == 0) {
            if (!parse_u64_arg(value, &max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
        } else if (std::strcmp(arg, "--max-output-bytes") == 0) {
            if (!parse_u64_arg(value, &policy.max_encoded_bytes)) {
                std::fprintf(stderr, "invalid --max-output-bytes value\n");
                return 2;
            }
        } else {
            std::fprintf(stderr, "clippack: unknown option `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
    }

    if (!pending.mime_types.empty()) {
        std::fprintf(stderr,
                     "clippack: %zu trailing MIME type(s) without content\n",
                     pending.mime_types.size());
        return 2;
    }

    EncodeOptions encode_options;
    apply_resource_policy(policy, &encode_options);

    std::vector<std::byte> stream;
    const EncodeResult r = encode_bulk(items, &stream, encode_options);
    if (r.status != EncodeStatus::Ok) {
        std::fprintf(stderr, "clippack: item[%u]: %s\n", r.failed_item,
                     encode_status_name(r.status));
        return 1;
    }

    std::FILE* f = stdout;
    if (out_path && std::strcmp(out_path, "-") != 0) {
        f = std::fopen(out_path, "wb");
        if (!f) {
            std::fprintf(stderr, "clippack: failed to open `%s`\n", out_path);
            return 1;
        }
    }
    const bool ok = write_all(f, stream);
    if (f != stdout && std::fclose(f) != 0) {
        std::fprintf(stderr, "clippack: failed to write `%s`\n", out_path);
        return 1;
    }
    if (!ok) {
        std::fprintf(stderr, "clippack: failed to write output\n");
        return 1;
    }
    return 0;
}
