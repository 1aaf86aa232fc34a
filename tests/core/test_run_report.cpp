#include "wsclean/core/run_report.hpp"
#include <gtest/gtest.h>
#include <numeric>

namespace wsclean::core {

class RunReportTest : public ::testing::Test {
protected:
    std::vector<FileOutcome> outcomes_{
        Cleaned{.path = "src/a.rs"},
        Skipped{.path = "src/b.rs"},
        ReadError{.path = "src/c.rs", .detail = "cannot open file: Permission denied"},
        Cleaned{.path = "src/d.rs"},
        WriteError{.path = "src/e.rs", .detail = "cannot replace file: Read-only file system"},
        Skipped{.path = "src/f.rs"},
    };
};

TEST_F(RunReportTest, FoldsOutcomesInOrder)
{
    auto report = std::accumulate(outcomes_.begin(), outcomes_.end(), RunReport{},
                                  accumulate_outcome);

    EXPECT_EQ(report.cleaned, (std::vector<std::string>{"src/a.rs", "src/d.rs"}));
    ASSERT_EQ(report.not_cleaned.size(), 2u);
    EXPECT_EQ(report.not_cleaned[0].path, "src/c.rs");
    EXPECT_EQ(report.not_cleaned[0].detail, "read failed: cannot open file: Permission denied");
    EXPECT_EQ(report.not_cleaned[1].path, "src/e.rs");
    EXPECT_EQ(report.not_cleaned[1].detail,
              "write failed: cannot replace file: Read-only file system");
    EXPECT_TRUE(report.traversal_errors.empty());
}

TEST_F(RunReportTest, CountsEveryCategory)
{
    auto report = std::accumulate(outcomes_.begin(), outcomes_.end(), RunReport{},
                                  accumulate_outcome);

    EXPECT_EQ(report.stats.files_checked, 6u);
    EXPECT_EQ(report.stats.files_cleaned, 2u);
    EXPECT_EQ(report.stats.files_unchanged, 2u);
    EXPECT_EQ(report.stats.files_failed, 2u);
    EXPECT_EQ(report.stats.traversal_errors, 0u);
    EXPECT_TRUE(report.has_failures());
}

TEST_F(RunReportTest, UnchangedFilesAreNotListed)
{
    auto report = accumulate_outcome(RunReport{}, Skipped{.path = "clean.rs"});

    EXPECT_TRUE(report.cleaned.empty());
    EXPECT_TRUE(report.not_cleaned.empty());
    EXPECT_EQ(report.stats.files_unchanged, 1u);
    EXPECT_FALSE(report.has_failures());
}

TEST_F(RunReportTest, TraversalErrorsAreCollected)
{
    auto report = accumulate_traversal_error(
        RunReport{}, TraversalError{.path = "root/private", .detail = "Permission denied"});

    ASSERT_EQ(report.traversal_errors.size(), 1u);
    EXPECT_EQ(report.traversal_errors[0].path, "root/private");
    EXPECT_EQ(report.stats.traversal_errors, 1u);
    EXPECT_EQ(report.stats.files_checked, 0u);
    EXPECT_TRUE(report.has_failures());
}

} // namespace wsclean::core
