/**
 * @file test_path.cpp
 * @brief Path normalization and containment tests
 */

#include "cverify/common.hpp"

#include <gtest/gtest.h>

using namespace cverify::common;

TEST(PathNormalization, UnixPaths)
{
    EXPECT_EQ(normalize_path("/home/user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/project/"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/../user/project"), "/home/user/project");
    EXPECT_EQ(normalize_path("/home/user/./project"), "/home/user/project");
}

TEST(PathNormalization, Backslashes)
{
    EXPECT_EQ(normalize_path("src\\main.ts"), "src/main.ts");
    EXPECT_EQ(normalize_path("C:\\Users\\dev\\project"), "C:/Users/dev/project");
}

TEST(PathNormalization, DotDot)
{
    EXPECT_EQ(normalize_path("a/b/../c"), "a/c");
    EXPECT_EQ(normalize_path("a/b/c/../../d"), "a/d");
    EXPECT_EQ(normalize_path("../a/b"), "../a/b");
    EXPECT_EQ(normalize_path("/../etc"), "/etc");
}

TEST(PathNormalization, Dot)
{
    EXPECT_EQ(normalize_path("./a/b"), "a/b");
    EXPECT_EQ(normalize_path("a/./b"), "a/b");
    EXPECT_EQ(normalize_path("a/b/."), "a/b");
}

TEST(PathNormalization, Empty)
{
    EXPECT_EQ(normalize_path(""), ".");
}

TEST(PathNormalization, IsAbsolute)
{
    EXPECT_TRUE(is_absolute_path("/home/user"));
    EXPECT_TRUE(is_absolute_path("\\share"));
    EXPECT_TRUE(is_absolute_path("C:/Users"));
    EXPECT_FALSE(is_absolute_path("relative/path"));
    EXPECT_FALSE(is_absolute_path("./relative"));
    EXPECT_FALSE(is_absolute_path(""));
}

TEST(PathContainment, AcceptsPathsBelowRoot)
{
    EXPECT_TRUE(is_contained_path("main.ts"));
    EXPECT_TRUE(is_contained_path("assembly/contracts/main.ts"));
    EXPECT_TRUE(is_contained_path("a/../b"));
}

TEST(PathContainment, RejectsEscapes)
{
    EXPECT_FALSE(is_contained_path(""));
    EXPECT_FALSE(is_contained_path("."));
    EXPECT_FALSE(is_contained_path(".."));
    EXPECT_FALSE(is_contained_path("../secret"));
    EXPECT_FALSE(is_contained_path("a/../../secret"));
    EXPECT_FALSE(is_contained_path("..\\secret"));
    EXPECT_FALSE(is_contained_path("/etc/passwd"));
    EXPECT_FALSE(is_contained_path("C:evil"));
}

TEST(PathComponents, SplitsOnBothSeparators)
{
    EXPECT_EQ(path_components("a/b\\c//d"), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_TRUE(path_components("").empty());
}
