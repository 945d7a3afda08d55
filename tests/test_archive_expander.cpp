#include <gtest/gtest.h>
#include "archive_expander.hpp"
#include "testing.hpp"
#include <algorithm>

using namespace driveaudit;
namespace fs = std::filesystem;

namespace {

class ArchiveExpanderTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory parent;
    WorkArea area{64ull * 1024 * 1024, parent.path()};

    [[nodiscard]] ExpansionResult expand(const std::vector<unsigned char>& zip,
                                         const ArchiveLimits limits = {}) {
        const ArchiveExpander expander(area, limits);
        return expander.expand(zip, "upload.zip");
    }
};

std::vector<unsigned char> sample_text() {
    return testutil::bytes(testutil::hds_text_report({testutil::SampleDrive{}}));
}

bool has_reason(const ExpansionResult& r, const ErrorReason reason) {
    return std::ranges::any_of(r.errors, [&](const ParseError& e) { return e.reason() == reason; });
}

} // namespace

TEST_F(ArchiveExpanderTest, ExtractsAndSniffsMembers) {
    const auto zip = testutil::make_zip({
        {"reports/a.txt", sample_text()},
        {"b.html", testutil::bytes(testutil::hds_html_report({testutil::SampleDrive{}}))},
    });
    const auto result = expand(zip);

    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.members.size(), 2u);
    EXPECT_EQ(result.members[0].name, "upload.zip/reports/a.txt");
    EXPECT_EQ(result.members[0].format, ReportFormat::Text);
    EXPECT_EQ(result.members[0].depth, 1u);
    EXPECT_EQ(result.members[0].load(), sample_text());
    EXPECT_EQ(result.members[1].name, "upload.zip/b.html");
    EXPECT_EQ(result.members[1].format, ReportFormat::Html);

    // members live inside the work area
    const std::string root = area.root().string();
    for (const auto& m : result.members) {
        EXPECT_EQ(m.path.string().rfind(root, 0), 0u);
    }
}

TEST_F(ArchiveExpanderTest, SkipsJunkEntriesSilently) {
    const auto zip = testutil::make_zip({
        {"__MACOSX/._a.txt", testutil::bytes("junk")},
        {".hidden/notes.txt", testutil::bytes("junk")},
        {"Thumbs.db", testutil::bytes("junk")},
        {"a.txt", sample_text()},
    });
    const auto result = expand(zip);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.members.size(), 1u);
    EXPECT_EQ(result.members[0].name, "upload.zip/a.txt");
}

TEST_F(ArchiveExpanderTest, ExpandsNestedArchivesWithinDepth) {
    const auto inner = testutil::make_zip({{"deep.txt", sample_text()}});
    const auto outer = testutil::make_zip({{"inner.zip", inner}, {"top.txt", sample_text()}});
    const auto result = expand(outer);

    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.members.size(), 2u);
    EXPECT_EQ(result.members[0].name, "upload.zip/inner.zip/deep.txt");
    EXPECT_EQ(result.members[0].depth, 2u);
    EXPECT_EQ(result.members[1].name, "upload.zip/top.txt");
}

TEST_F(ArchiveExpanderTest, NestingBeyondDepthIsReported) {
    auto zip = testutil::make_zip({{"level4.txt", sample_text()}});
    zip = testutil::make_zip({{"level4.zip", zip}, {"level3.txt", sample_text()}});
    zip = testutil::make_zip({{"level3.zip", zip}});
    zip = testutil::make_zip({{"level2.zip", zip}});

    const auto result = expand(zip, ArchiveLimits{3, 100, 1000, 1024 * 1024});

    ASSERT_EQ(result.members.size(), 1u);
    EXPECT_EQ(result.members[0].name, "upload.zip/level2.zip/level3.zip/level3.txt");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].reason(), ErrorReason::NestedArchiveDepthExceeded);
    EXPECT_EQ(result.errors[0].file_name(), "upload.zip/level2.zip/level3.zip/level4.zip");
}

TEST_F(ArchiveExpanderTest, TooManyMembersRejectsTheArchive) {
    const auto zip = testutil::make_zip({
        {"a.txt", sample_text()},
        {"b.txt", sample_text()},
        {"c.txt", sample_text()},
    });
    const auto result = expand(zip, ArchiveLimits{3, 100, 2, 1024 * 1024});
    EXPECT_TRUE(result.members.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].reason(), ErrorReason::ArchiveCorrupt);
    EXPECT_EQ(result.errors[0].file_name(), "upload.zip");
}

TEST_F(ArchiveExpanderTest, OversizedMemberIsSkipped) {
    const auto zip = testutil::make_zip({
        {"big.txt", std::vector<unsigned char>(8192, 'x')},
        {"a.txt", sample_text()},
    });
    const auto result = expand(zip, ArchiveLimits{3, 100, 1000, 4096});
    ASSERT_EQ(result.members.size(), 1u);
    EXPECT_EQ(result.members[0].name, "upload.zip/a.txt");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].file_name(), "upload.zip/big.txt");
    EXPECT_EQ(result.errors[0].reason(), ErrorReason::ArchiveCorrupt);
}

TEST_F(ArchiveExpanderTest, PathTraversalIsRejected) {
    const auto zip = testutil::make_zip({
        {"../../escape.txt", sample_text()},
        {"a.txt", sample_text()},
    });
    const auto result = expand(zip);
    ASSERT_EQ(result.members.size(), 1u);
    EXPECT_TRUE(has_reason(result, ErrorReason::ArchiveCorrupt));
    EXPECT_FALSE(fs::exists(parent.path() / "escape.txt"));
}

TEST_F(ArchiveExpanderTest, CorruptArchiveYieldsError) {
    std::vector<unsigned char> zip = {'P', 'K', 0x03, 0x04};
    zip.insert(zip.end(), 200, 0xFF);
    const auto result = expand(zip);
    EXPECT_TRUE(result.members.empty());
    ASSERT_FALSE(result.errors.empty());
    EXPECT_EQ(result.errors[0].reason(), ErrorReason::ArchiveCorrupt);
    EXPECT_EQ(result.errors[0].file_name(), "upload.zip");
}

TEST_F(ArchiveExpanderTest, TruncatedArchiveYieldsError) {
    auto zip = testutil::make_zip({
        {"a.txt", sample_text()},
        {"b.txt", sample_text()},
    });
    zip.resize(zip.size() / 2);
    const auto result = expand(zip);
    EXPECT_TRUE(result.members.empty());
    EXPECT_TRUE(has_reason(result, ErrorReason::ArchiveCorrupt));
}

TEST_F(ArchiveExpanderTest, ExpansionBombIsFatal) {
    // highly compressible payload well past the ratio allowance and the fixed slack
    const auto zip = testutil::make_zip({{"bomb.txt", std::vector<unsigned char>(4 * 1024 * 1024, 'A')}});
    ASSERT_LT(zip.size(), 64u * 1024);
    try {
        (void)expand(zip, ArchiveLimits{3, 2, 1000, 100ull * 1024 * 1024});
        FAIL() << "bomb not detected";
    } catch (const ResourceExhaustedError& e) {
        EXPECT_EQ(e.file_name(), "upload.zip");
    }
}

TEST_F(ArchiveExpanderTest, RepeatedEntryNamesKeepTheirOwnBytes) {
    testutil::SampleDrive first;
    testutil::SampleDrive second;
    second.serial = "Z1D5K2AB";
    const auto first_bytes = testutil::bytes(testutil::hds_text_report({first}));
    const auto second_bytes = testutil::bytes(testutil::hds_text_report({second}));
    const auto zip = testutil::make_zip({
        {"report.txt", first_bytes},
        {"report.txt", second_bytes},
    });
    const auto result = expand(zip);

    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.members.size(), 2u);
    EXPECT_EQ(result.members[0].name, "upload.zip/report.txt");
    EXPECT_EQ(result.members[1].name, "upload.zip/report.txt");
    EXPECT_NE(result.members[0].path, result.members[1].path);
    EXPECT_EQ(result.members[0].load(), first_bytes);
    EXPECT_EQ(result.members[1].load(), second_bytes);
}

TEST_F(ArchiveExpanderTest, FileNamedLikeADirectoryPrefix) {
    const auto zip = testutil::make_zip({
        {"a", sample_text()},
        {"a/b.txt", sample_text()},
    });
    const auto result = expand(zip);

    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.members.size(), 2u);
    EXPECT_EQ(result.members[0].name, "upload.zip/a");
    EXPECT_EQ(result.members[1].name, "upload.zip/a/b.txt");
    EXPECT_EQ(result.members[1].load(), sample_text());
}
