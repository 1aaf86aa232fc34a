#include "wsclean/core/file_filter.hpp"
#include <gtest/gtest.h>

namespace wsclean::core {

namespace {

auto file(std::string path, std::optional<std::string> extension) -> DirEntry {
    return DirEntry{.path = std::move(path), .is_regular_file = true, .extension = extension};
}

} // namespace

TEST(FileFilterTest, NormalizeExtension)
{
    EXPECT_EQ(normalize_extension("rs"), "rs");
    EXPECT_EQ(normalize_extension(".rs"), "rs");
    EXPECT_EQ(normalize_extension(" cpp "), "cpp");
    EXPECT_EQ(normalize_extension(""), "");
    EXPECT_EQ(normalize_extension("  "), "");
}

TEST(FileFilterTest, NoFilterAcceptsEveryRegularFile)
{
    EXPECT_TRUE(should_process(file("a.rs", "rs"), std::nullopt));
    EXPECT_TRUE(should_process(file("Makefile", std::nullopt), std::nullopt));
}

TEST(FileFilterTest, DirectoriesAreNeverProcessed)
{
    DirEntry directory{.path = "src", .is_regular_file = false, .extension = std::nullopt};

    EXPECT_FALSE(should_process(directory, std::nullopt));
    EXPECT_FALSE(should_process(directory, std::vector<std::string>{"rs"}));
}

TEST(FileFilterTest, MatchesListedExtensions)
{
    std::optional<std::vector<std::string>> extensions = std::vector<std::string>{"rs", ".toml"};

    EXPECT_TRUE(should_process(file("main.rs", "rs"), extensions));
    EXPECT_TRUE(should_process(file("Cargo.toml", "toml"), extensions));
    EXPECT_FALSE(should_process(file("README.md", "md"), extensions));
    EXPECT_FALSE(should_process(file("Makefile", std::nullopt), extensions));
}

TEST(FileFilterTest, MatchingIsCaseSensitive)
{
    std::optional<std::vector<std::string>> extensions = std::vector<std::string>{"rs"};

    EXPECT_FALSE(should_process(file("MAIN.RS", "RS"), extensions));
}

TEST(FileFilterTest, EmptyFilterListAcceptsNothing)
{
    std::optional<std::vector<std::string>> extensions = std::vector<std::string>{};

    EXPECT_FALSE(should_process(file("main.rs", "rs"), extensions));
}

} // namespace wsclean::core
