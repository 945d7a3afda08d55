#include <gtest/gtest.h>
#include "duplicate_reconciler.hpp"
#include <algorithm>

using namespace driveaudit;
using namespace std::chrono;

namespace {

    CanonicalDriveRecord record(const std::string& serial, const std::string& file,
                                const ReportFormat format, const std::size_t index = 0) {
        CanonicalDriveRecord r;
        r.serial_number = serial;
        r.label_serial = serial.substr(0, 8);
        r.model = "ST1000DM003-1CH162";
        r.vendor = "Seagate";
        r.interface_type = InterfaceType::Sata;
        r.capacity_bytes = 1000204886016ull;
        r.overall_health = HealthVerdict::Pass;
        r.temperature_celsius = 31;
        r.source_file_name = file;
        r.source_format = format;
        r.source_index = index;
        r.source_encoding = "utf-8";
        r.extracted_at = Timestamp{sys_days{2024y / March / 1}};
        return r;
    }

    SmartAttribute attribute(const unsigned id, const std::uint64_t raw) {
        SmartAttribute a;
        a.id = id;
        a.name = "Attribute " + std::to_string(id);
        a.raw_value = raw;
        a.normalized_value = 100;
        a.status = AttributeStatus::Ok;
        return a;
    }

    const FieldResolution* find_resolution(const ReconciliationGroup& g, const std::string& field) {
        for (const auto& r : g.resolutions) {
            if (r.field == field) return &r;
        }
        return nullptr;
    }

} // namespace

TEST(DuplicateReconciler, DistinctSerialsStayApartAndSorted) {
    const auto groups = DuplicateReconciler{}.reconcile({
        record("Z1D5K2AB", "b.txt", ReportFormat::Text),
        record("WD-WCC6Y0ABCDEF", "a.txt", ReportFormat::Text),
    });
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].serial_number, "WD-WCC6Y0ABCDEF");
    EXPECT_EQ(groups[1].serial_number, "Z1D5K2AB");
    EXPECT_FALSE(groups[0].has_conflicts());
    EXPECT_EQ(groups[0].members.size(), 1u);
    EXPECT_EQ(groups[0].merged.source_file_name, "a.txt");
}

TEST(DuplicateReconciler, GroupKey) {
    EXPECT_EQ(DuplicateReconciler::group_key("  z1d5k2ab "), "Z1D5K2AB");
}

TEST(DuplicateReconciler, FormatPrecedenceBreaksTies) {
    auto text = record("Z1D5K2AB", "drive.txt", ReportFormat::Text);
    auto pdf = record("Z1D5K2AB", "drive.pdf", ReportFormat::Pdf);
    auto html = record("Z1D5K2AB", "drive.html", ReportFormat::Html);
    text.model = "ST1000DM003";
    html.model = "ST1000DM003-1CH162";
    pdf.model = "ST1000DM003-1CH1";

    const auto groups = DuplicateReconciler{}.reconcile({text, html, pdf});
    ASSERT_EQ(groups.size(), 1u);
    const auto& g = groups[0];
    ASSERT_EQ(g.members.size(), 3u);
    EXPECT_EQ(g.members[0].source_format, ReportFormat::Pdf);
    EXPECT_EQ(g.members[1].source_format, ReportFormat::Html);
    EXPECT_EQ(g.members[2].source_format, ReportFormat::Text);
    EXPECT_EQ(g.merged.model, "ST1000DM003-1CH1");
    EXPECT_EQ(g.merged.source_file_name, "drive.pdf");

    const FieldResolution* model = find_resolution(g, "model");
    ASSERT_NE(model, nullptr);
    EXPECT_TRUE(model->conflict);
    EXPECT_EQ(model->chosen_value, "ST1000DM003-1CH1");
    EXPECT_EQ(model->chosen.file_name, "drive.pdf");
    ASSERT_EQ(model->observed.size(), 3u);
    EXPECT_EQ(model->observed[0].value, "ST1000DM003");
    EXPECT_EQ(model->observed[1].value, "ST1000DM003-1CH1");
    EXPECT_EQ(model->observed[2].value, "ST1000DM003-1CH162");
    EXPECT_EQ(model->observed[2].source.format, ReportFormat::Html);

    const FieldResolution* capacity = find_resolution(g, "capacity_bytes");
    ASSERT_NE(capacity, nullptr);
    EXPECT_FALSE(capacity->conflict);
    EXPECT_EQ(capacity->chosen_value, "1000204886016");
}

TEST(DuplicateReconciler, CompletenessBeatsFormat) {
    auto pdf = record("Z1D5K2AB", "drive.pdf", ReportFormat::Pdf);
    auto text = record("Z1D5K2AB", "drive.txt", ReportFormat::Text);
    text.power_on_hours = 9052;
    text.temperature_celsius = 35;
    EXPECT_GT(DuplicateReconciler::completeness(text), DuplicateReconciler::completeness(pdf));

    const auto groups = DuplicateReconciler{}.reconcile({pdf, text});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].members[0].source_format, ReportFormat::Text);
    EXPECT_EQ(groups[0].merged.temperature_celsius, 35);
    EXPECT_EQ(groups[0].merged.power_on_hours, 9052u);
}

TEST(DuplicateReconciler, NewerReportBeatsFormat) {
    auto pdf = record("Z1D5K2AB", "old.pdf", ReportFormat::Pdf);
    auto text = record("Z1D5K2AB", "new.txt", ReportFormat::Text);
    text.extracted_at = Timestamp{sys_days{2024y / April / 1}};
    text.temperature_celsius = 40;

    const auto groups = DuplicateReconciler{}.reconcile({pdf, text});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_TRUE(DuplicateReconciler::outranks(text, pdf));
    EXPECT_EQ(groups[0].merged.temperature_celsius, 40);
    EXPECT_EQ(groups[0].merged.extracted_at, text.extracted_at);
}

TEST(DuplicateReconciler, MissingFieldsFilledFromLowerRankedMembers) {
    auto pdf = record("Z1D5K2AB", "drive.pdf", ReportFormat::Pdf);
    auto text = record("Z1D5K2AB", "drive.txt", ReportFormat::Text);
    pdf.grown_defects = 3;
    text.firmware_revision = "CC47";

    const auto groups = DuplicateReconciler{}.reconcile({text, pdf});
    ASSERT_EQ(groups.size(), 1u);
    const auto& g = groups[0];
    EXPECT_EQ(g.members[0].source_format, ReportFormat::Pdf);
    EXPECT_EQ(g.merged.firmware_revision, "CC47");
    EXPECT_EQ(g.merged.grown_defects, 3u);

    const FieldResolution* firmware = find_resolution(g, "firmware_revision");
    ASSERT_NE(firmware, nullptr);
    EXPECT_FALSE(firmware->conflict);
    EXPECT_EQ(firmware->chosen.file_name, "drive.txt");
    EXPECT_EQ(firmware->observed.size(), 1u);

    // nobody reported these
    EXPECT_EQ(find_resolution(g, "power_on_hours"), nullptr);
    EXPECT_EQ(find_resolution(g, "vendor_information"), nullptr);
}

TEST(DuplicateReconciler, SmartConflictsAreAudited) {
    auto a = record("Z1D5K2AB", "a.html", ReportFormat::Html);
    auto b = record("Z1D5K2AB", "b.html", ReportFormat::Html);
    a.smart_attributes.emplace(5, attribute(5, 0));
    a.smart_attributes.emplace(194, attribute(194, 31));
    b.smart_attributes.emplace(5, attribute(5, 8));
    b.smart_attributes.emplace(194, attribute(194, 31));

    const auto groups = DuplicateReconciler{}.reconcile({b, a});
    ASSERT_EQ(groups.size(), 1u);
    const auto& g = groups[0];
    // equal rank down to the file name
    EXPECT_EQ(g.members[0].source_file_name, "a.html");
    EXPECT_EQ(g.merged.smart_attributes.at(5).raw_value, 0u);

    // agreeing attributes still record where the merged value came from
    const FieldResolution* temperature = find_resolution(g, "smart.194");
    ASSERT_NE(temperature, nullptr);
    EXPECT_FALSE(temperature->conflict);
    EXPECT_EQ(temperature->chosen.file_name, "a.html");
    EXPECT_EQ(temperature->observed.size(), 2u);

    const FieldResolution* realloc = find_resolution(g, "smart.5");
    ASSERT_NE(realloc, nullptr);
    EXPECT_TRUE(realloc->conflict);
    EXPECT_EQ(realloc->chosen.file_name, "a.html");
    ASSERT_EQ(realloc->observed.size(), 2u);
    EXPECT_EQ(realloc->observed[0].value.rfind("raw=0 ", 0), 0u);
    EXPECT_EQ(realloc->observed[1].value.rfind("raw=8 ", 0), 0u);
    EXPECT_TRUE(g.has_conflicts());
    EXPECT_EQ(g.source_files(), (std::vector<std::string>{"a.html", "b.html"}));
}

TEST(DuplicateReconciler, ResultDoesNotDependOnInputOrder) {
    std::vector<CanonicalDriveRecord> records = {
        record("Z1D5K2AB", "x.txt", ReportFormat::Text, 0),
        record("Z1D5K2AB", "x.txt", ReportFormat::Text, 1),
        record("Z1D5K2AB", "y.html", ReportFormat::Html),
        record("S0M1ABCD", "z.pdf", ReportFormat::Pdf),
        record("S0M1ABCD", "w.pdf", ReportFormat::Pdf),
    };
    records[1].model = "ST1000DM010";
    records[3].grown_defects = 0;
    records[4].grown_defects = 2;

    const auto expected = DuplicateReconciler{}.reconcile(records);
    std::ranges::reverse(records);
    EXPECT_EQ(DuplicateReconciler{}.reconcile(records), expected);
    std::ranges::rotate(records, records.begin() + 2);
    EXPECT_EQ(DuplicateReconciler{}.reconcile(records), expected);

    ASSERT_EQ(expected.size(), 2u);
    EXPECT_EQ(expected[0].serial_number, "S0M1ABCD");
    EXPECT_EQ(expected[0].merged.grown_defects, 2u); // w.pdf sorts first
    EXPECT_EQ(expected[1].members.size(), 3u);
}

TEST(DuplicateReconciler, SameFileNameOrderedByContent) {
    // two inputs named report.txt from different directories
    auto a = record("Z1D5K2AB", "report.txt", ReportFormat::Text);
    auto b = record("Z1D5K2AB", "report.txt", ReportFormat::Text);
    a.temperature_celsius = 30;
    b.temperature_celsius = 45;
    a.smart_attributes.emplace(5, attribute(5, 0));
    b.smart_attributes.emplace(5, attribute(5, 8));

    const auto forward = DuplicateReconciler{}.reconcile({a, b});
    const auto backward = DuplicateReconciler{}.reconcile({b, a});
    EXPECT_EQ(forward, backward);
    ASSERT_EQ(forward.size(), 1u);
    EXPECT_EQ(forward[0].merged.temperature_celsius, 30);
    EXPECT_EQ(forward[0].merged.smart_attributes.at(5).raw_value, 0u);
}

TEST(DuplicateReconciler, SameFileNameOrderedBySmartContent) {
    auto a = record("Z1D5K2AB", "report.txt", ReportFormat::Text);
    auto b = record("Z1D5K2AB", "report.txt", ReportFormat::Text);
    a.smart_attributes.emplace(5, attribute(5, 3));
    b.smart_attributes.emplace(5, attribute(5, 8));

    const auto forward = DuplicateReconciler{}.reconcile({b, a});
    EXPECT_EQ(forward, DuplicateReconciler{}.reconcile({a, b}));
    ASSERT_EQ(forward.size(), 1u);
    EXPECT_EQ(forward[0].merged.smart_attributes.at(5).raw_value, 3u);
}
