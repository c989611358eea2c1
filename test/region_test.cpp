#include <gtest/gtest.h>

#include "region.h"

TEST(RegionTest, TableOrder) {
  const string_array &tags = getRegionTags();
  ASSERT_EQ(tags.size(), 7u);
  EXPECT_EQ(tags.front(), "🇭🇰 香港节点");
  EXPECT_EQ(tags.back(), "🎥 奈飞节点");
  EXPECT_TRUE(isRegionTag("🇯🇵 日本节点"));
  EXPECT_FALSE(isRegionTag("🚀 节点选择"));
}

TEST(RegionTest, KeywordsAndFlags) {
  EXPECT_EQ(matchRegions("香港 IPLC 01"), (string_array{"🇭🇰 香港节点"}));
  EXPECT_EQ(matchRegions("Hong Kong 02"), (string_array{"🇭🇰 香港节点"}));
  EXPECT_EQ(matchRegions("🇸🇬 Node"), (string_array{"🇸🇬 狮城节点"}));
  EXPECT_EQ(matchRegions("taipei-1"), (string_array{"🇨🇳 台湾节点"}));
  EXPECT_EQ(matchRegions("洛杉矶 01"), (string_array{"🇺🇲 美国节点"}));
  EXPECT_EQ(matchRegions("Seoul KR"), (string_array{"🇰🇷 韩国节点"}));
}

TEST(RegionTest, WordBoundaries) {
  EXPECT_TRUE(matchRegions("SHKX").empty());
  EXPECT_TRUE(matchRegions("Russia").empty());
  EXPECT_EQ(matchRegions("us-west"), (string_array{"🇺🇲 美国节点"}));
  EXPECT_EQ(matchRegions("HK_01"), (string_array{"🇭🇰 香港节点"}));
  EXPECT_EQ(matchRegions("node_jp_2"), (string_array{"🇯🇵 日本节点"}));
  EXPECT_TRUE(matchRegions("HK1").empty());
}

TEST(RegionTest, MultipleGroups) {
  EXPECT_EQ(matchRegions("JP Netflix"),
            (string_array{"🇯🇵 日本节点", "🎥 奈飞节点"}));
  EXPECT_TRUE(matchRegions("Direct").empty());
}
