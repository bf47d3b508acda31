#include <gtest/gtest.h>

#include "xdgdirs/util/search_path.hpp"

using namespace xdgdirs::util;

TEST(SearchPathTest, SplitListEmptyValueHasNoEntries) {
  EXPECT_TRUE(splitList("").empty());
}

TEST(SearchPathTest, SplitListKeepsOrder) {
  auto entries = splitList("/h/t/.local/share/datas:/xdg-data");

  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0], "/h/t/.local/share/datas");
  EXPECT_EQ(entries[1], "/xdg-data");
}

TEST(SearchPathTest, SplitListKeepsInteriorEmptyEntries) {
  auto entries = splitList("/a::/b");

  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[1], "");
}

TEST(SearchPathTest, JoinListIsInverseOfSplit) {
  const std::string value = "/usr/local/share/:/usr/share/";

  EXPECT_EQ(joinList(splitList(value)), value);
  EXPECT_EQ(joinList({}), "");
}

TEST(SearchPathTest, JoinPathCollapsesTrailingSeparator) {
  EXPECT_EQ(joinPath("/usr/local/share/", "app"), "/usr/local/share/app");
  EXPECT_EQ(joinPath("/etc/xdg", "app"), "/etc/xdg/app");
}

TEST(SearchPathTest, JoinPathIgnoresEmptyElements) {
  EXPECT_EQ(joinPath("", "app"), "app");
  EXPECT_EQ(joinPath("/base", ""), "/base");
  EXPECT_EQ(joinPath("", ""), "");
  EXPECT_EQ(joinPath({"/home/t", "", ".config", "app"}), "/home/t/.config/app");
}

TEST(SearchPathTest, JoinPathCleansLexically) {
  EXPECT_EQ(joinPath("/a//b/./c", "d"), "/a/b/c/d");
  EXPECT_EQ(joinPath("/a/b/..", "c"), "/a/c");
}

TEST(SearchPathTest, JoinPathTreatsSegmentAsRelative) {
  // An absolute segment is still appended, not substituted
  EXPECT_EQ(joinPath("/base", "/abs"), "/base/abs");
}

TEST(SearchPathTest, CleanPathKeepsRoot) {
  EXPECT_EQ(cleanPath("/"), "/");
  EXPECT_EQ(cleanPath(""), "");
}
