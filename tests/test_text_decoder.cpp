#include <gtest/gtest.h>
#include "string_utils.hpp"
#include "testing.hpp"
#include "text_decoder.hpp"

using namespace driveaudit;

TEST(TextDecoder, PlainUtf8PassesThrough) {
    const auto data = testutil::bytes("Serial Number: ABC123\n");
    const DecodedText decoded = decode_text(data);
    EXPECT_EQ(decoded.text, "Serial Number: ABC123\n");
    EXPECT_EQ(decoded.encoding, "utf-8");
    EXPECT_EQ(decoded.encodings_tried, std::vector<std::string>{"utf-8"});
}

TEST(TextDecoder, Utf8BomIsStripped) {
    const std::vector<unsigned char> data = {0xEF, 0xBB, 0xBF, 'O', 'K'};
    const DecodedText decoded = decode_text(data);
    EXPECT_EQ(decoded.text, "OK");
    EXPECT_EQ(decoded.encoding, "utf-8");
}

TEST(TextDecoder, Utf16LittleEndianWithBom) {
    const std::vector<unsigned char> data = {0xFF, 0xFE, 'D', 0, 'i', 0, 's', 0, 'k', 0, 0xB0, 0x00};
    const DecodedText decoded = decode_text(data);
    EXPECT_EQ(decoded.encoding, "utf-16le");
    EXPECT_EQ(decoded.text, "Disk\xC2\xB0");
    EXPECT_EQ(decoded.encodings_tried, (std::vector<std::string>{"utf-8", "utf-16le"}));
}

TEST(TextDecoder, Utf16BigEndianWithBom) {
    const std::vector<unsigned char> data = {0xFE, 0xFF, 0, 'O', 0, 'K'};
    const DecodedText decoded = decode_text(data);
    EXPECT_EQ(decoded.encoding, "utf-16be");
    EXPECT_EQ(decoded.text, "OK");
}

TEST(TextDecoder, InvalidUtf8FallsBackToWindows1252) {
    // 0xB0 is the degree sign, 0x80 the euro sign in windows-1252
    const std::vector<unsigned char> data = {'3', '5', ' ', 0xB0, 'C', ' ', 0x80};
    const DecodedText decoded = decode_text(data);
    EXPECT_EQ(decoded.encoding, "windows-1252");
    EXPECT_EQ(decoded.text, "35 \xC2\xB0" "C \xE2\x82\xAC");
    EXPECT_EQ(decoded.encodings_tried, (std::vector<std::string>{"utf-8", "windows-1252"}));
}

TEST(TextDecoder, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("\xC2\xB0" "C"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));          // truncated
}

TEST(StringUtils, BoundedCopyNeverSplitsACharacter) {
    const std::string text = "ab\xC2\xB0";
    EXPECT_EQ(bounded_copy(text, 3), "ab");
    EXPECT_EQ(bounded_copy(text, 4), text);
    EXPECT_EQ(bounded_copy("abcdef", 4), "abcd");
}

TEST(StringUtils, ColumnsSplitOnGaps) {
    EXPECT_EQ(split_columns("  5  Reallocated Sectors\t140   OK"),
              (std::vector<std::string>{"5", "Reallocated Sectors", "140", "OK"}));
    EXPECT_EQ(first_column("  ST1000DM003  extra"), "ST1000DM003");
    EXPECT_EQ(collapse_whitespace("  a \t b\n"), "a b");
}
