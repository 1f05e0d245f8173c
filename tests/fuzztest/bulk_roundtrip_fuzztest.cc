#include "richclip/bulk_decode.h"
#include "richclip/bulk_encode.h"
#include "richclip/byte_source.h"
#include "richclip/utf8.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace richclip {

static std::vector<DataItem>
make_items(const std::vector<std::pair<std::vector<std::string>,
                                       std::vector<uint8_t>>>& raw)
{
    std::vector<DataItem> items;
    for (const auto& [labels, content] : raw) {
        DataItem item;
        for (const std::string& label : labels) {
            const std::span<const std::byte> b(
                reinterpret_cast<const std::byte*>(label.data()), label.size());
            if (is_valid_utf8(b)) {
                item.mime_types.push_back(label);
            }
        }
        if (item.mime_types.empty()) {
            item.mime_types.emplace_back("application/octet-stream");
        }
        for (uint8_t v : content) {
            item.content.push_back(static_cast<std::byte>(v));
        }
        items.push_back(std::move(item));
    }
    return items;
}


static void
EncodedItemsDecodeUnchanged(
    const std::vector<std::pair<std::vector<std::string>, std::vector<uint8_t>>>&
        raw)
{
    const std::vector<DataItem> items = make_items(raw);

    std::vector<std::byte> stream;
    const EncodeResult er = encode_bulk(items, &stream);
    ASSERT_EQ(er.status, EncodeStatus::Ok);

    // Unlimited budgets: any stream the encoder accepts must decode.
    BulkDecodeOptions options;
    options.limits = BulkDecodeLimits {};

    std::vector<DataItem> decoded;
    SpanByteSource source(stream);
    const DecodeResult dr = decode_bulk(source, &decoded, options);
    ASSERT_EQ(dr.status, DecodeStatus::Ok);
    EXPECT_EQ(dr.bytes_consumed, stream.size());
    EXPECT_EQ(decoded, items);
}

FUZZ_TEST(BulkRoundTripFuzz, EncodedItemsDecodeUnchanged);


static void
ArbitraryBytesNeverYieldPartialOutput(const std::vector<uint8_t>& raw)
{
    std::vector<std::byte> bytes;
    for (uint8_t v : raw) {
        bytes.push_back(static_cast<std::byte>(v));
    }

    BulkDecodeOptions options;
    options.limits.max_content_bytes = 1U << 20;
    options.limits.max_total_bytes   = 4ULL << 20;

    std::vector<DataItem> decoded(1);
    SpanByteSource source(bytes);
    const DecodeResult dr = decode_bulk(source, &decoded, options);
    if (dr.status != DecodeStatus::Ok) {
        EXPECT_TRUE(decoded.empty());
    }
    for (const DataItem& item : decoded) {
        EXPECT_FALSE(item.mime_types.empty());
    }
}

FUZZ_TEST(BulkRoundTripFuzz, ArbitraryBytesNeverYieldPartialOutput);

}  // namespace richclip
