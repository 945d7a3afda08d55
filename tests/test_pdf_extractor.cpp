#include <gtest/gtest.h>
#include "pdf_extractor.hpp"
#include "testing.hpp"

using namespace driveaudit;

TEST(PdfExtractor, SingleDrive) {
    const auto data = testutil::scsi_toolbox_pdf({testutil::ScsiDrive{}});
    const auto result = PdfExtractor{}.extract(data, "toolbox.pdf");

    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.records.size(), 1u);
    const RawDriveRecord& r = result.records[0];
    EXPECT_EQ(r.source_format, ReportFormat::Pdf);
    EXPECT_EQ(r.location, "line 1");
    EXPECT_EQ(r.encoding, "utf-8");
    EXPECT_EQ(r.serial, "S0M1ABCD");
    EXPECT_EQ(r.model, "ST600MM0006");
    EXPECT_EQ(r.vendor_information, "SEAGATE");
    EXPECT_EQ(r.firmware, "0004");
    EXPECT_EQ(r.interface, "SAS");
    EXPECT_EQ(r.capacity, "600 GB");
    EXPECT_EQ(r.temperature, "38 C");
    EXPECT_EQ(r.power_on, "21,504");
    EXPECT_EQ(r.grown_defects, "3");
    EXPECT_EQ(r.status, "OK");
    EXPECT_EQ(r.report_date, "03/05/2024 11:30:00");
    EXPECT_NE(r.excerpt.find("Serial Number: S0M1ABCD"), std::string::npos);
}

TEST(PdfExtractor, OneDrivePerPage) {
    testutil::ScsiDrive second;
    second.serial = "S0M1WXYZ";
    second.grown_defects = "0";
    const auto data = testutil::scsi_toolbox_pdf({testutil::ScsiDrive{}, second});
    const auto result = PdfExtractor{}.extract(data, "two.pdf");

    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0].serial, "S0M1ABCD");
    EXPECT_EQ(result.records[0].grown_defects, "3");
    EXPECT_EQ(result.records[1].serial, "S0M1WXYZ");
    EXPECT_EQ(result.records[1].grown_defects, "0");
    EXPECT_EQ(result.records[1].index, 1u);
    EXPECT_EQ(result.records[1].location, "line 13");
}

TEST(PdfExtractor, RowsRebuiltFromPositionedRuns) {
    const std::string page =
        "BT /F1 10 Tf 50 700 Td (Serial Number: AB12CD34) Tj ET\n"
        "BT /F1 10 Tf 300 700 Td (SMART Status: OK) Tj ET\n"
        "BT /F1 10 Tf 50 680 Td [(Model)-50(: ST4000NM0035)] TJ ET\n";
    const auto result = PdfExtractor{}.extract(testutil::make_pdf({page}), "columns.pdf");

    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].serial, "AB12CD34");
    EXPECT_EQ(result.records[0].status, "OK");
    EXPECT_EQ(result.records[0].model, "ST4000NM0035");
}

TEST(PdfExtractor, NonFinitePositionSkipsPage) {
    const std::string huge = "1" + std::string(400, '0') + ".0";
    const std::string bad_page =
        "BT /F1 10 Tf 1 0 0 1 " + huge + " 700 Tm (Serial Number: ZZZZ9999) Tj ET\n";
    const auto data = testutil::make_pdf({
        testutil::text_page(testutil::scsi_toolbox_lines(testutil::ScsiDrive{})),
        bad_page,
    });
    const auto result = PdfExtractor{}.extract(data, "bad-page.pdf");

    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].serial, "S0M1ABCD");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].reason(), ErrorReason::MalformedContent);
    EXPECT_EQ(result.errors[0].offset_hint(), std::optional<std::string>("page 2"));
}

TEST(PdfExtractor, UnreadableDocument) {
    const auto result = PdfExtractor{}.extract(testutil::bytes("%PDF-1.4\nthis is not a pdf body\n"), "junk.pdf");
    EXPECT_TRUE(result.records.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].reason(), ErrorReason::MalformedContent);
    EXPECT_EQ(result.errors[0].format_guess(), ReportFormat::Pdf);
    EXPECT_EQ(result.errors[0].detail().rfind("cannot open PDF", 0), 0u);
}

TEST(PdfExtractor, PageWithoutText) {
    const auto result = PdfExtractor{}.extract(testutil::make_pdf({"q 1 0 0 1 0 0 cm Q\n"}), "blank.pdf");
    EXPECT_TRUE(result.records.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].detail(), "no extractable text");
}
