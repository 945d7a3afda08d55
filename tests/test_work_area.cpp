#include <gtest/gtest.h>
#include "parse_error.hpp"
#include "testing.hpp"
#include "work_area.hpp"
#include <fstream>

using namespace driveaudit;
namespace fs = std::filesystem;

TEST(WorkArea, CreatesAndRemovesItsRoot) {
    testutil::TemporaryDirectory parent;
    fs::path root;
    {
        WorkArea area(1024, parent.path());
        root = area.root();
        EXPECT_TRUE(fs::is_directory(root));
        EXPECT_EQ(root.parent_path(), parent.path());

        const fs::path sub = area.make_subdir("zip");
        std::ofstream(sub / "member.txt") << "data";
        EXPECT_TRUE(fs::exists(sub / "member.txt"));
    }
    EXPECT_FALSE(fs::exists(root));
    EXPECT_EQ(parent.entry_count(), 0u);
}

TEST(WorkArea, SubdirectoriesAreDistinct) {
    testutil::TemporaryDirectory parent;
    WorkArea area(1024, parent.path());
    EXPECT_NE(area.make_subdir("zip"), area.make_subdir("zip"));
}

TEST(WorkArea, ByteBudgetIsEnforced) {
    testutil::TemporaryDirectory parent;
    WorkArea area(100, parent.path());
    area.reserve(60, "a.zip");
    EXPECT_EQ(area.bytes_used(), 60u);
    try {
        area.reserve(41, "b.zip");
        FAIL() << "budget overrun not reported";
    } catch (const ResourceExhaustedError& e) {
        EXPECT_EQ(e.file_name(), "b.zip");
    }
}

TEST(WorkArea, RemovedWhenUnwinding) {
    testutil::TemporaryDirectory parent;
    EXPECT_THROW({
        WorkArea area(10, parent.path());
        area.reserve(11, "bomb.zip");
    }, ResourceExhaustedError);
    EXPECT_EQ(parent.entry_count(), 0u);
}
