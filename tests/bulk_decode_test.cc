#include "richclip/bulk_decode.h"
#include "richclip/bulk_encode.h"
#include "richclip/byte_source.h"
#include "richclip/wire_format.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace richclip {
namespace {

    std::span<const std::byte> as_bytes(std::string_view s)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(s.data()), s.size());
    }

    void add_mime(std::vector<std::byte>* out, std::string_view s)
    {
        ASSERT_TRUE(append_section('M', as_bytes(s), out));
    }

    void add_content(std::vector<std::byte>* out, std::string_view s)
    {
        ASSERT_TRUE(append_section('C', as_bytes(s), out));
    }

    std::vector<std::byte> content_of(std::string_view s)
    {
        const std::span<const std::byte> b = as_bytes(s);
        return std::vector<std::byte>(b.begin(), b.end());
    }

    DecodeResult decode(const std::vector<std::byte>& stream,
                        std::vector<DataItem>* items,
                        const BulkDecodeOptions& options = BulkDecodeOptions {})
    {
        SpanByteSource source(stream);
        return decode_bulk(source, items, options);
    }

    std::vector<std::byte> header()
    {
        std::vector<std::byte> out;
        append_stream_header(&out);
        return out;
    }

}  // namespace


TEST(BulkDecodeTest, DecodesSingleItemFromRawBytes)
{
    const std::vector<std::byte> stream = {
        std::byte { 0x20 }, std::byte { 0x09 }, std::byte { 0x02 },
        std::byte { 0x14 }, std::byte { 0x00 }, std::byte { 'M' },
        std::byte { 0x00 }, std::byte { 0x00 }, std::byte { 0x00 },
        std::byte { 0x04 }, std::byte { 'T' },  std::byte { 'E' },
        std::byte { 'X' },  std::byte { 'T' },  std::byte { 'C' },
        std::byte { 0x00 }, std::byte { 0x00 }, std::byte { 0x00 },
        std::byte { 0x04 }, std::byte { 'G' },  std::byte { 'O' },
        std::byte { 'O' },  std::byte { 'D' },
    };

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(items.size(), 1U);
    EXPECT_EQ(items[0].mime_types, std::vector<std::string> { "TEXT" });
    EXPECT_EQ(items[0].content, content_of("GOOD"));
    EXPECT_EQ(r.items_decoded, 1U);
    EXPECT_EQ(r.sections_decoded, 2U);
    EXPECT_EQ(r.bytes_consumed, stream.size());
}


TEST(BulkDecodeTest, GroupsMimeTypesPerContentSection)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "text/plain");
    add_mime(&stream, "TEXT");
    add_content(&stream, "GOOD");
    add_mime(&stream, "text/html");
    add_content(&stream, "BAD");

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(items.size(), 2U);

    EXPECT_EQ(items[0].mime_types,
              (std::vector<std::string> { "text/plain", "TEXT" }));
    EXPECT_EQ(items[0].content, content_of("GOOD"));
    EXPECT_EQ(items[1].mime_types, std::vector<std::string> { "text/html" });
    EXPECT_EQ(items[1].content, content_of("BAD"));
}


TEST(BulkDecodeTest, PreservesDuplicateMimeTypes)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "text/plain");
    add_mime(&stream, "text/plain");
    add_content(&stream, "x");

    std::vector<DataItem> items;
    ASSERT_EQ(decode(stream, &items).status, DecodeStatus::Ok);
    ASSERT_EQ(items.size(), 1U);
    EXPECT_EQ(items[0].mime_types,
              (std::vector<std::string> { "text/plain", "text/plain" }));
}


TEST(BulkDecodeTest, HeaderOnlyStreamYieldsNoItems)
{
    const std::vector<std::byte> stream = header();

    std::vector<DataItem> items(3);
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_TRUE(items.empty());
}


TEST(BulkDecodeTest, EmptyContentIsValid)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "text/plain");
    add_content(&stream, "");

    std::vector<DataItem> items;
    ASSERT_EQ(decode(stream, &items).status, DecodeStatus::Ok);
    ASSERT_EQ(items.size(), 1U);
    EXPECT_TRUE(items[0].content.empty());
}


TEST(BulkDecodeTest, EveryMagicByteIsChecked)
{
    for (size_t i = 0; i < kStreamMagic.size(); ++i) {
        std::vector<std::byte> stream = header();
        add_mime(&stream, "text/plain");
        add_content(&stream, "GOOD");
        stream[i] ^= std::byte { 0x01 };

        std::vector<DataItem> items;
        const DecodeResult r = decode(stream, &items);
        EXPECT_EQ(r.status, DecodeStatus::BadMagic) << "byte " << i;
        EXPECT_EQ(r.field, DecodeField::Magic);
        EXPECT_EQ(r.sections_decoded, 0U);
        EXPECT_EQ(r.bytes_consumed, kStreamMagic.size());
        EXPECT_TRUE(items.empty());
    }
}


TEST(BulkDecodeTest, RejectsUnsupportedVersion)
{
    std::vector<std::byte> stream = header();
    stream[4]                     = std::byte { 99 };
    stream.push_back(std::byte { 'M' });

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::UnsupportedVersion);
    EXPECT_EQ(r.field, DecodeField::Version);
    EXPECT_EQ(r.version, 99U);
    EXPECT_EQ(r.offset, 4U);
}


TEST(BulkDecodeTest, TruncatedHeader)
{
    std::vector<std::byte> stream = header();
    stream.pop_back();

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::TruncatedInput);
    EXPECT_EQ(r.field, DecodeField::Version);

    const std::vector<std::byte> empty;
    EXPECT_EQ(decode(empty, &items).status, DecodeStatus::TruncatedInput);
}


TEST(BulkDecodeTest, ContentWithoutMimeTypeFails)
{
    std::vector<std::byte> stream = header();
    add_content(&stream, "GOOD");

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::ContentWithoutMimeType);
    EXPECT_EQ(r.field, DecodeField::SectionTag);
    EXPECT_EQ(r.offset, kHeaderBytes);
}


TEST(BulkDecodeTest, SecondContentNeedsItsOwnMimeType)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "text/plain");
    add_content(&stream, "one");
    add_content(&stream, "two");

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::ContentWithoutMimeType);
    EXPECT_EQ(r.items_decoded, 1U);
    EXPECT_TRUE(items.empty());
}


TEST(BulkDecodeTest, TrailingMimeTypesAreDropped)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "text/plain");
    add_content(&stream, "GOOD");
    add_mime(&stream, "text/html");
    add_mime(&stream, "HTML");

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(items.size(), 1U);
    EXPECT_EQ(items[0].mime_types, std::vector<std::string> { "text/plain" });
    EXPECT_EQ(r.pending_mime_types_dropped, 2U);
}


TEST(BulkDecodeTest, UnknownSectionTagReportsByte)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "text/plain");
    const size_t tag_offset = stream.size();
    ASSERT_TRUE(append_section('X', as_bytes("??"), &stream));

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::UnknownSectionTag);
    EXPECT_EQ(r.tag, static_cast<uint8_t>('X'));
    EXPECT_EQ(r.field, DecodeField::SectionTag);
    EXPECT_EQ(r.offset, tag_offset);
}


TEST(BulkDecodeTest, TruncatedSectionLength)
{
    std::vector<std::byte> stream = header();
    stream.push_back(std::byte { 'M' });
    stream.push_back(std::byte { 0 });
    stream.push_back(std::byte { 0 });

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::TruncatedInput);
    EXPECT_EQ(r.field, DecodeField::SectionLength);
    EXPECT_EQ(r.offset, kHeaderBytes + kSectionTagBytes);
}


TEST(BulkDecodeTest, TruncatedContentPayloadDiscardsEarlierItems)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "text/plain");
    add_content(&stream, "GOOD");
    add_mime(&stream, "text/html");
    add_content(&stream, "<p>hello</p>");
    stream.pop_back();

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::TruncatedInput);
    EXPECT_EQ(r.field, DecodeField::ContentPayload);
    EXPECT_EQ(r.declared_length, 12U);
    EXPECT_EQ(r.items_decoded, 1U);
    EXPECT_TRUE(items.empty());
}


TEST(BulkDecodeTest, InvalidUtf8MimeType)
{
    std::vector<std::byte> stream = header();
    const std::byte bad[2]        = { std::byte { 0xFF }, std::byte { 0xFE } };
    ASSERT_TRUE(append_section('M', bad, &stream));
    add_content(&stream, "GOOD");

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    EXPECT_EQ(r.status, DecodeStatus::InvalidEncoding);
    EXPECT_EQ(r.field, DecodeField::MimeTypePayload);
    EXPECT_EQ(r.offset, kHeaderBytes + kSectionTagBytes + kSectionLengthBytes);
}


TEST(BulkDecodeTest, EnforcesContentSizeLimitBeforeReading)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "application/octet-stream");
    stream.push_back(std::byte { 'C' });
    stream.push_back(std::byte { 0x7F });
    stream.push_back(std::byte { 0xFF });
    stream.push_back(std::byte { 0xFF });
    stream.push_back(std::byte { 0xFF });

    BulkDecodeOptions options;
    options.limits.max_content_bytes = 1024;

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items, options);
    EXPECT_EQ(r.status, DecodeStatus::LimitExceeded);
    EXPECT_EQ(r.field, DecodeField::SectionLength);
    EXPECT_EQ(r.declared_length, 0x7FFFFFFFU);
}


TEST(BulkDecodeTest, EnforcesItemAndMimeTypeCountLimits)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "a");
    add_mime(&stream, "b");
    add_content(&stream, "1");
    add_mime(&stream, "c");
    add_content(&stream, "2");

    {
        BulkDecodeOptions options;
        options.limits.max_mime_types_per_item = 1;
        std::vector<DataItem> items;
        EXPECT_EQ(decode(stream, &items, options).status,
                  DecodeStatus::LimitExceeded);
    }
    {
        BulkDecodeOptions options;
        options.limits.max_items = 1;
        std::vector<DataItem> items;
        EXPECT_EQ(decode(stream, &items, options).status,
                  DecodeStatus::LimitExceeded);
    }
    {
        BulkDecodeOptions options;
        options.limits.max_sections = 4;
        std::vector<DataItem> items;
        EXPECT_EQ(decode(stream, &items, options).status,
                  DecodeStatus::LimitExceeded);
    }
    {
        BulkDecodeOptions options;
        options.limits.max_total_bytes = stream.size() - 1U;
        std::vector<DataItem> items;
        EXPECT_EQ(decode(stream, &items, options).status,
                  DecodeStatus::LimitExceeded);
    }
    {
        BulkDecodeOptions options;
        options.limits.max_sections            = 5;
        options.limits.max_items               = 2;
        options.limits.max_mime_types_per_item = 2;
        options.limits.max_total_bytes         = stream.size();
        std::vector<DataItem> items;
        EXPECT_EQ(decode(stream, &items, options).status, DecodeStatus::Ok);
        EXPECT_EQ(items.size(), 2U);
    }
}


TEST(BulkDecodeTest, MimeTypeSizeLimit)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, std::string(32, 'a'));
    add_content(&stream, "x");

    BulkDecodeOptions options;
    options.limits.max_mime_type_bytes = 31;

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items, options);
    EXPECT_EQ(r.status, DecodeStatus::LimitExceeded);
    EXPECT_EQ(r.declared_length, 32U);
}


TEST(BulkDecodeTest, DefaultLimitsAcceptLongAndNumerousMimeTypes)
{
    DataItem item;
    item.mime_types.push_back(std::string(5000, 'a'));
    for (int i = 0; i < 2000; ++i) {
        item.mime_types.push_back("x-label/" + std::to_string(i));
    }
    item.content = content_of("payload");
    const std::vector<DataItem> encoded_items = { item };

    std::vector<std::byte> stream;
    ASSERT_EQ(encode_bulk(encoded_items, &stream).status, EncodeStatus::Ok);

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(r.bytes_consumed, stream.size());
    EXPECT_EQ(items, encoded_items);
}


TEST(BulkDecodeTest, TotalBudgetCheckedBeforeSectionBody)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "a");
    add_content(&stream, std::string(1000, 'x'));

    BulkDecodeOptions options;
    options.limits.max_total_bytes = 100;

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items, options);
    EXPECT_EQ(r.status, DecodeStatus::LimitExceeded);
    EXPECT_EQ(r.field, DecodeField::SectionLength);
    EXPECT_EQ(r.declared_length, 1000U);
    EXPECT_EQ(r.bytes_consumed,
              kHeaderBytes + 2U * (kSectionTagBytes + kSectionLengthBytes)
                  + 1U);
    EXPECT_TRUE(items.empty());
}


TEST(BulkDecodeTest, UnknownTagWinsOverSectionLimit)
{
    std::vector<std::byte> stream = header();
    add_mime(&stream, "a");
    add_content(&stream, "1");
    stream.push_back(std::byte { 'Z' });

    BulkDecodeOptions options;
    options.limits.max_sections = 2;

    std::vector<DataItem> items;
    const DecodeResult r = decode(stream, &items, options);
    EXPECT_EQ(r.status, DecodeStatus::UnknownSectionTag);
    EXPECT_EQ(r.tag, static_cast<uint8_t>('Z'));
    EXPECT_EQ(r.field, DecodeField::SectionTag);
}


TEST(BulkDecodeTest, StatusNames)
{
    EXPECT_EQ(decode_status_name(DecodeStatus::Ok), "ok");
    EXPECT_EQ(decode_status_name(DecodeStatus::BadMagic), "bad_magic");
    EXPECT_EQ(decode_status_name(DecodeStatus::ContentWithoutMimeType),
              "content_without_mime_type");
    EXPECT_EQ(decode_field_name(DecodeField::SectionLength), "section_length");
}

}  // namespace richclip
