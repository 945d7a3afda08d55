#include <gtest/gtest.h>
#include "field_matcher.hpp"

using namespace driveaudit;

TEST(FieldMatcher, DottedLeaderLabels) {
    RawDriveRecord rec;
    match_fields("Hard Disk Model ID . . . . . . : ST1000DM003-1CH162\n"
                 "Hard Disk Serial Number  . . . : Z1D5K2AB\n"
                 "Health . . . . . . . . . . . . : 98 % (Excellent)\n",
                 rec);
    EXPECT_EQ(rec.model, "ST1000DM003-1CH162");
    EXPECT_EQ(rec.serial, "Z1D5K2AB");
    EXPECT_EQ(rec.health, "98 % (Excellent)");
}

TEST(FieldMatcher, SpecificLabelBeatsGenericOne) {
    // "Serial" alone is the weakest serial label even when it comes first
    const auto serial = match_field("Serial: WRONG\nHard Disk Serial Number: RIGHT\n", Field::Serial);
    ASSERT_TRUE(serial.has_value());
    EXPECT_EQ(*serial, "RIGHT");
}

TEST(FieldMatcher, FirstLineWinsAmongEqualLabels) {
    const auto model = match_field("Model: FIRST\nModel: SECOND\n", Field::Model);
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(*model, "FIRST");
}

TEST(FieldMatcher, SeveralPairsOnOneLine) {
    RawDriveRecord rec;
    match_fields("Serial Number: ABC12345    Firmware: 0004\tCapacity: 600 GB\n", rec);
    EXPECT_EQ(rec.serial, "ABC12345");
    EXPECT_EQ(rec.firmware, "0004");
    EXPECT_EQ(rec.capacity, "600 GB");
}

TEST(FieldMatcher, ExistingValuesAreKept) {
    RawDriveRecord rec;
    rec.model = "FROM ELSEWHERE";
    match_fields("Model: IGNORED\nSerial Number: S1234567\n", rec);
    EXPECT_EQ(rec.model, "FROM ELSEWHERE");
    EXPECT_EQ(rec.serial, "S1234567");
}

TEST(FieldMatcher, PlainColonLabel) {
    EXPECT_EQ(match_field("Serial Number: X1234567", Field::Serial), "X1234567");
    EXPECT_EQ(match_field("  - Firmware = 0004", Field::Firmware), "0004");
}

TEST(FieldMatcher, MegabyteLongLines) {
    const std::string filler(1024 * 1024, 'A');

    const auto model = match_field("Model : " + filler + "\n", Field::Model);
    ASSERT_TRUE(model.has_value());
    EXPECT_FALSE(model->empty());
    EXPECT_LE(model->size(), 1024u);
    EXPECT_EQ(model->front(), 'A');

    EXPECT_EQ(count_serial_labels("Serial Number: " + filler + "\n"), 1u);
    EXPECT_TRUE(is_block_marker("Drive 1: " + filler));
    EXPECT_FALSE(is_block_marker("Drive " + filler + ": 1"));
    EXPECT_FALSE(match_field(filler + ": value\n", Field::Model).has_value());
}

TEST(FieldMatcher, EmptyValuesDoNotMatch) {
    EXPECT_FALSE(match_field("Serial Number:\nModel: X\n", Field::Serial).has_value());
}

TEST(FieldMatcher, BlockMarkers) {
    EXPECT_TRUE(is_block_marker("Hard Disk Summary"));
    EXPECT_TRUE(is_block_marker("  Drive 2"));
    EXPECT_TRUE(is_block_marker("Disk #1 - ST1000DM003"));
    EXPECT_TRUE(is_block_marker("Hard Disk Number . . . : 0"));
    EXPECT_TRUE(is_block_marker("SCSI Toolbox Drive Report"));
    EXPECT_FALSE(is_block_marker("Drive Temperature: 38 C"));
    EXPECT_FALSE(is_block_marker("Disk Status: OK"));
    EXPECT_FALSE(is_block_marker("Serial Number: 1234"));
}

TEST(FieldMatcher, SplitBlocksKeepsPreamble) {
    const auto split = split_blocks("Report created: 2024-01-01\n"
                                    "\n"
                                    "Hard Disk Summary\n"
                                    "Hard Disk Number : 0\n"
                                    "Serial Number: A1234567\n"
                                    "Hard Disk Summary\n"
                                    "Hard Disk Number : 1\n"
                                    "Serial Number: B1234567\n");
    EXPECT_EQ(split.preamble, "Report created: 2024-01-01\n\n");
    ASSERT_EQ(split.blocks.size(), 2u);
    EXPECT_EQ(split.blocks[0].first_line, 3u);
    EXPECT_EQ(split.blocks[1].first_line, 6u);
    EXPECT_EQ(match_field(split.blocks[0].text, Field::Serial), "A1234567");
    EXPECT_EQ(match_field(split.blocks[1].text, Field::Serial), "B1234567");
}

TEST(FieldMatcher, NoMarkersNoBlocks) {
    const auto split = split_blocks("Serial Number: A1234567\nModel: X\n");
    EXPECT_TRUE(split.blocks.empty());
    EXPECT_EQ(count_serial_labels("Serial Number: A1\nSerial Number: B2\nModel: X\n"), 2u);
    EXPECT_TRUE(has_labeled_fields(split.preamble));
}

TEST(FieldMatcher, SmartTableWithHexData) {
    const auto rows = parse_smart_table(
        "No.  Attribute                  Thre..  Value  Worst  Data          Status   Flags\n"
        "  5  Reallocated Sectors Count  140     200    200    000000000000  OK       Event count\n"
        "194  Temperature                0       110    97     000000000021  OK       Always passing\n"
        "\n"
        "  9  Not part of the table      0       1      1      000000000001  OK       Always passing\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].id, "5");
    EXPECT_EQ(rows[0].name, "Reallocated Sectors Count");
    EXPECT_EQ(rows[0].threshold, "140");
    EXPECT_EQ(rows[0].value, "200");
    EXPECT_EQ(rows[1].id, "194");
    EXPECT_EQ(rows[1].raw, "000000000021");
    EXPECT_EQ(rows[1].status, "OK");
    EXPECT_TRUE(rows[1].raw_is_hex);
}

TEST(FieldMatcher, SmartTableWithDecimalRaw) {
    const auto rows = parse_smart_table(
        "ID  Attribute Name          Value  Worst  Threshold  Raw Value\n"
        "9   Power-On Hours          97     97     0          3412\n"
        "x   Garbage row             1      1      1          1\n"
        "12  Power Cycle Count\n");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].id, "9");
    EXPECT_EQ(rows[0].raw, "3412");
    EXPECT_FALSE(rows[0].raw_is_hex);
}
