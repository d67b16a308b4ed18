#include <gtest/gtest.h>
#include "AssetQuery.hpp"

#include "Config.hpp"

TEST(AssetQueryParse, DefaultsWhenEmpty) {
    AssetQuery q = AssetQuery::fromQueryString("");
    EXPECT_EQ(q.model, cfg::DEFAULT_MODEL);
    EXPECT_FALSE(q.texture.has_value());
    EXPECT_FALSE(q.texturePath().has_value());

    q = AssetQuery::fromArgs({});
    EXPECT_EQ(q.model, cfg::DEFAULT_MODEL);
}

TEST(AssetQueryParse, QueryString) {
    AssetQuery q = AssetQuery::fromQueryString("?model=Chair.glb&texture=wood.png");
    EXPECT_EQ(q.model, "Chair.glb");
    ASSERT_TRUE(q.texture.has_value());
    EXPECT_EQ(*q.texture, "wood.png");
}

TEST(AssetQueryParse, LeadingQuestionMarkIsOptional) {
    AssetQuery q = AssetQuery::fromQueryString("texture=a.png&model=b.glb");
    EXPECT_EQ(q.model, "b.glb");
    EXPECT_EQ(q.texture.value_or(""), "a.png");
}

TEST(AssetQueryParse, EmptyValuesAndUnknownKeysAreIgnored) {
    AssetQuery q = AssetQuery::fromQueryString("?model=&texture=&debug=1&&flag");
    EXPECT_EQ(q.model, cfg::DEFAULT_MODEL);
    EXPECT_FALSE(q.texture.has_value());
}

TEST(AssetQueryParse, PercentDecoding) {
    AssetQuery q = AssetQuery::fromQueryString("?model=My%20Chair+v2.glb");
    EXPECT_EQ(q.model, "My Chair v2.glb");

    EXPECT_EQ(query::decodeComponent("a%2Fb"), "a/b");
    EXPECT_EQ(query::decodeComponent("100%"), "100%");
    EXPECT_EQ(query::decodeComponent("%zz"), "%zz");
}

TEST(AssetQueryParse, Arguments) {
    AssetQuery q = AssetQuery::fromArgs({"model=Lamp.glb", "stray", "texture=t.jpg"});
    EXPECT_EQ(q.model, "Lamp.glb");
    EXPECT_EQ(q.texture.value_or(""), "t.jpg");

    q = AssetQuery::fromArgs({"?model=Desk.glb"});
    EXPECT_EQ(q.model, "Desk.glb");
}

TEST(AssetQueryPaths, ResolvedUnderAssetDirectories) {
    AssetQuery q = AssetQuery::fromQueryString("?model=m.glb&texture=t.png");
    EXPECT_EQ(q.modelPath(), std::string(cfg::MODELS_DIR) + "/m.glb");
    EXPECT_EQ(q.texturePath().value_or(""), std::string(cfg::TEXTURES_DIR) + "/t.png");
}
