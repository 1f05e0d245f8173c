#include "richclip/build_info.h"
#include "richclip/bulk_decode.h"
#include "richclip/bulk_encode.h"
#include "richclip/byte_source.h"
#include "richclip/console_format.h"
#include "richclip/oneshot_decode.h"
#include "richclip/resource_policy.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstdio>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace richclip {
namespace {

    using PyItem = std::pair<std::vector<std::string>, nb::bytes>;

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static std::span<const std::byte> bytes_view(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.c_str()), data.size());
    }


    static void throw_decode_error(const DecodeResult& r)
    {
        char msg[160];
        std::snprintf(msg, sizeof(msg), "%s (field=%s offset=%llu tag=0x%02X)",
                      decode_status_name(r.status).data(),
                      decode_field_name(r.field).data(),
                      static_cast<unsigned long long>(r.offset),
                      static_cast<unsigned>(r.tag));
        if (r.status == DecodeStatus::IoFailed) {
            throw std::runtime_error(msg);
        }
        throw nb::value_error(msg);
    }


    static std::vector<PyItem> items_to_python(std::vector<DataItem>& items)
    {
        std::vector<PyItem> out;
        out.reserve(items.size());
        for (DataItem& item : items) {
            nb::bytes content(reinterpret_cast<const char*>(
                                  item.content.data()),
                              item.content.size());
            out.emplace_back(std::move(item.mime_types), std::move(content));
        }
        return out;
    }


    static std::vector<PyItem> py_decode_bulk(nb::bytes data,
                                              const BulkDecodeLimits& limits)
    {
        const std::span<const std::byte> bytes = bytes_view(data);
        std::vector<DataItem> items;
        DecodeResult r;
        {
            nb::gil_scoped_release gil_release;
            SpanByteSource source(bytes);
            BulkDecodeOptions options;
            options.limits = limits;
            r              = decode_bulk(source, &items, options);
        }
        if (r.status != DecodeStatus::Ok) {
            throw_decode_error(r);
        }
        return items_to_python(items);
    }


    static std::vector<PyItem>
    py_decode_oneshot(nb::bytes data, const std::vector<std::string>& mime_types,
                      uint64_t max_content_bytes)
    {
        const std::span<const std::byte> bytes = bytes_view(data);
        std::vector<DataItem> items;
        DecodeResult r;
        {
            nb::gil_scoped_release gil_release;
            SpanByteSource source(bytes);
            OneshotDecodeOptions options;
            options.limits.max_content_bytes = max_content_bytes;
            r = decode_oneshot(source, mime_types, &items, options);
        }
        if (r.status != DecodeStatus::Ok) {
            throw_decode_error(r);
        }
        return items_to_python(items);
    }


    static nb::bytes py_encode_bulk(const std::vector<PyItem>& py_items,
                                    uint64_t max_output_bytes)
    {
        std::vector<DataItem> items(py_items.size());
        for (size_t i = 0; i < py_items.size(); ++i) {
            items[i].mime_types = py_items[i].first;
            const std::span<const std::byte> b = bytes_view(py_items[i].second);
            items[i].content.assign(b.begin(), b.end());
        }

        std::vector<std::byte> out;
        EncodeOptions options;
        options.max_output_bytes = max_output_bytes;
        const EncodeResult r     = encode_bulk(items, &out, options);
        switch (r.status) {
        case EncodeStatus::Ok: break;
        case EncodeStatus::EmptyMimeTypes:
            throw nb::value_error("item has no MIME types");
        case EncodeStatus::InvalidEncoding:
            throw nb::value_error("MIME type is not valid UTF-8");
        case EncodeStatus::LimitExceeded:
            throw nb::value_error("encoded stream exceeds limits");
        }
        return nb::bytes(reinterpret_cast<const char*>(out.data()), out.size());
    }


    static std::string hex_bytes(nb::bytes data, uint32_t max_bytes)
    {
        std::string out;
        append_hex_bytes(bytes_view(data), max_bytes, ' ', &out);
        return out;
    }


    static std::string version_line()
    {
        std::string line;
        format_version_line(build_info(), &line);
        return line;
    }


    static std::string limits_line(const BulkDecodeLimits& limits)
    {
        std::string line;
        format_limits_line(limits, &line);
        return line;
    }

}  // namespace
}  // namespace richclip

NB_MODULE(richclip, m)
{
    using namespace richclip;

    m.doc()               = "richclip stream framing bindings (nanobind).";
    m.attr("__version__") = RICHCLIP_VERSION_STRING;
    m.attr("PROTOCOL_VERSION") = static_cast<unsigned>(kProtocolVersion);

    nb::class_<BulkDecodeLimits>(m, "BulkDecodeLimits")
        .def(nb::init<>())
        .def_rw("max_sections", &BulkDecodeLimits::max_sections)
        .def_rw("max_items", &BulkDecodeLimits::max_items)
        .def_rw("max_mime_types_per_item",
                &BulkDecodeLimits::max_mime_types_per_item)
        .def_rw("max_mime_type_bytes", &BulkDecodeLimits::max_mime_type_bytes)
        .def_rw("max_content_bytes", &BulkDecodeLimits::max_content_bytes)
        .def_rw("max_total_bytes", &BulkDecodeLimits::max_total_bytes);
    m.def("untrusted_bulk_limits", []() { return untrusted_bulk_limits(); });

    m.def("decode_bulk", &py_decode_bulk, "data"_a,
          "limits"_a = untrusted_bulk_limits(),
          "Decodes a bulk stream into a list of (mime_types, content).");
    m.def("decode_oneshot", &py_decode_oneshot, "data"_a, "mime_types"_a,
          "max_content_bytes"_a = OneshotDecodeLimits {}.max_content_bytes,
          "Wraps data as one item labelled with the non-empty mime_types.");
    m.def("encode_bulk", &py_encode_bulk, "items"_a,
          "max_output_bytes"_a = 0ULL,
          "Encodes (mime_types, content) pairs into a bulk stream.");
    m.def("hex_bytes", &hex_bytes, "data"_a, "max_bytes"_a = 4096U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]           = sv_to_py(bi.version);
        d["build_type"]        = sv_to_py(bi.build_type);
        d["compiler"]          = sv_to_py(bi.compiler);
        d["target"]            = sv_to_py(bi.target);
        d["configured_at_utc"] = sv_to_py(bi.configured_at_utc);
        d["protocol_version"]  = static_cast<unsigned>(bi.protocol_version);
        return d;
    });
    m.def("version_line", &version_line);
    m.def("limits_line", &limits_line, "limits"_a = untrusted_bulk_limits());
}
