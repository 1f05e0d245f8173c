#include "richclip/console_format.h"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace richclip {

TEST(ConsoleFormatTest, EscapesControlAndNonAscii)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii("a\tb\n\x01\xC3\xA9", 0, &out));
    EXPECT_EQ(out, "a\\tb\\n\\x01\\xC3\\xA9");

    out.clear();
    EXPECT_FALSE(append_console_escaped_ascii("text/plain", 0, &out));
    EXPECT_EQ(out, "text/plain");
}


TEST(ConsoleFormatTest, TruncatesText)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
    EXPECT_EQ(out, "abc...");
}


TEST(ConsoleFormatTest, HexWithSeparator)
{
    const std::array<std::byte, 5> bytes = {
        std::byte { 0x20 }, std::byte { 0x09 }, std::byte { 0x02 },
        std::byte { 0x14 }, std::byte { 0x00 },
    };

    std::string out;
    append_hex_bytes(bytes, 0, ' ', &out);
    EXPECT_EQ(out, "20 09 02 14 00");

    out.clear();
    append_hex_bytes(bytes, 2, '\0', &out);
    EXPECT_EQ(out, "2009...");
}


TEST(ConsoleFormatTest, MimeTypeList)
{
    const std::vector<std::string> labels = { "text/plain", "a\"b" };

    std::string out;
    append_mime_type_list(labels, 0, &out);
    EXPECT_EQ(out, "[\"text/plain\", \"a\\\"b\"]");

    out.clear();
    append_mime_type_list({}, 0, &out);
    EXPECT_EQ(out, "[]");
}

}  // namespace richclip
