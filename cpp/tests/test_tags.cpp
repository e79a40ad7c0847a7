#include <gtest/gtest.h>
#include "tags.h"

using namespace promptvault;

using Tags = std::vector<std::string>;

TEST(TagsTest, NormalizeDedupesCaseInsensitivelyKeepingFirstSpelling) {
    EXPECT_EQ(tags::normalize({"A", " a ", "b"}), (Tags{"A", "b"}));
}

TEST(TagsTest, NormalizeTrimsAndDropsEmpty) {
    EXPECT_EQ(tags::normalize({"  writing ", "", "   ", "\tcode\n"}), (Tags{"writing", "code"}));
    EXPECT_TRUE(tags::normalize({}).empty());
}

TEST(TagsTest, NormalizeIsIdempotent) {
    Tags once = tags::normalize({"AI", "ai", " Writing", "writing ", "code"});
    EXPECT_EQ(tags::normalize(once), once);
    EXPECT_EQ(once, (Tags{"AI", "Writing", "code"}));
}

TEST(TagsTest, ParseTagInputSplitsOnCommas) {
    EXPECT_EQ(tags::parseTagInput("ai, writing,,AI "), (Tags{"ai", "writing"}));
    EXPECT_TRUE(tags::parseTagInput("").empty());
    EXPECT_TRUE(tags::parseTagInput(" , ,").empty());
}

TEST(TagsTest, EncodeWritesJsonArray) {
    EXPECT_EQ(tags::encode({"a", "b"}), "[\"a\",\"b\"]");
    EXPECT_EQ(tags::encode({}), "[]");
}

TEST(TagsTest, DecodeToleratesBadInput) {
    EXPECT_EQ(tags::decode("[\"x\",\"y\"]"), (Tags{"x", "y"}));
    EXPECT_TRUE(tags::decode("").empty());
    EXPECT_TRUE(tags::decode("not json").empty());
    EXPECT_TRUE(tags::decode("{\"a\":1}").empty());
    EXPECT_EQ(tags::decode("[\"x\", 3, null]"), (Tags{"x"}));
}

TEST(TagsTest, HasTagMatchesWholeTagOnly) {
    Tags list{"ai-ml", "Writing"};
    EXPECT_FALSE(tags::hasTag(list, "ai"));
    EXPECT_TRUE(tags::hasTag(list, "ai-ml"));
    EXPECT_TRUE(tags::hasTag(list, "writing"));
    EXPECT_TRUE(tags::hasTag(list, " WRITING "));
    EXPECT_FALSE(tags::hasTag(list, "   "));
}
