#include "wsclean/ui/report_view.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>

namespace wsclean::ui {

using ::testing::HasSubstr;
using ::testing::Not;

class ReportViewTest : public ::testing::Test {
protected:
    RunReport report_{
        .cleaned = {"src/main.rs", "src/lib.rs"},
        .not_cleaned = {FileFailure{.path = "src/locked.rs",
                                    .detail = "read failed: cannot open file: Permission denied"}},
        .traversal_errors = {TraversalError{.path = "src/private", .detail = "Permission denied"}},
        .stats = RunStats{.files_checked = 5,
                          .files_cleaned = 2,
                          .files_unchanged = 2,
                          .files_failed = 1,
                          .traversal_errors = 1,
                          .duration = std::chrono::milliseconds(42)},
        .dry_run = false,
    };
};

TEST_F(ReportViewTest, ListsEveryCategory)
{
    auto output = render_report(report_, false);

    EXPECT_THAT(output, HasSubstr("Cleaned:"));
    EXPECT_THAT(output, HasSubstr("    src/main.rs"));
    EXPECT_THAT(output, HasSubstr("    src/lib.rs"));
    EXPECT_THAT(output, HasSubstr("Not cleaned:"));
    EXPECT_THAT(output, HasSubstr("    src/locked.rs (read failed: cannot open file: Permission denied)"));
    EXPECT_THAT(output, HasSubstr("Traversal errors:"));
    EXPECT_THAT(output, HasSubstr("    src/private: Permission denied"));
}

TEST_F(ReportViewTest, CategoriesAppearInOrder)
{
    auto output = render_report(report_, false);

    auto cleaned = output.find("Cleaned:");
    auto not_cleaned = output.find("Not cleaned:");
    auto traversal = output.find("Traversal errors:");
    auto summary = output.find("Checked 5 files");

    ASSERT_NE(cleaned, std::string::npos);
    EXPECT_LT(cleaned, not_cleaned);
    EXPECT_LT(not_cleaned, traversal);
    EXPECT_LT(traversal, summary);
}

TEST_F(ReportViewTest, EmptyCategoriesAreOmitted)
{
    RunReport clean_run;
    clean_run.stats.files_checked = 3;
    clean_run.stats.files_unchanged = 3;

    auto output = render_report(clean_run, false);

    EXPECT_THAT(output, Not(HasSubstr("Cleaned:")));
    EXPECT_THAT(output, Not(HasSubstr("Not cleaned:")));
    EXPECT_THAT(output, Not(HasSubstr("Traversal errors:")));
    EXPECT_THAT(output, HasSubstr("Checked 3 files"));
}

TEST_F(ReportViewTest, DryRunUsesWouldClean)
{
    report_.dry_run = true;

    auto output = render_report(report_, false);

    EXPECT_THAT(output, HasSubstr("Would clean:"));
    EXPECT_THAT(output, Not(HasSubstr("Cleaned:")));
    EXPECT_THAT(format_summary(report_), HasSubstr("2 would be cleaned"));
}

TEST_F(ReportViewTest, Summary)
{
    EXPECT_EQ(format_summary(report_),
              "Checked 5 files: 2 cleaned, 2 already clean, 1 not cleaned, 1 traversal errors "
              "(42 ms)");
}

TEST_F(ReportViewTest, RowsHaveNoTrailingWhitespace)
{
    auto output = render_report(report_, false);

    std::istringstream rows(output);
    std::string row;
    size_t count = 0;
    while (std::getline(rows, row)) {
        ++count;
        EXPECT_TRUE(row.empty() || (row.back() != ' ' && row.back() != '\r')) << "row: " << row;
    }
    EXPECT_EQ(count, 8u);
    EXPECT_NE(output.back(), ' ');
}

TEST_F(ReportViewTest, ColoredOutputKeepsEntries)
{
    auto output = render_report(report_, true);

    EXPECT_THAT(output, HasSubstr("src/main.rs"));
    EXPECT_THAT(output, HasSubstr("Checked 5 files"));
}

} // namespace wsclean::ui
