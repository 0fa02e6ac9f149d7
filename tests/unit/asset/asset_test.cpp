#include <gtest/gtest.h>

#include "ark/asset/asset.hpp"

using namespace ark::asset;

TEST(AssetTest, SplitsPathIntoParts) {
    Asset asset("models/hero.skin.glb");
    EXPECT_EQ(asset.directory(), "models/");
    EXPECT_EQ(asset.name(), "hero.skin");
    EXPECT_EQ(asset.extension(), ".glb");
    EXPECT_EQ(asset.longExtension(), ".skin.glb");
    EXPECT_EQ(asset.basename(), "hero.skin.glb");
    EXPECT_EQ(asset.key(), "models/hero.skin.glb");
    EXPECT_EQ(asset.toString(), asset.key());
}

TEST(AssetTest, BackslashesAreSeparators) {
    Asset asset("textures\\ui\\button.png");
    EXPECT_EQ(asset.directory(), "textures/ui/");
    EXPECT_EQ(asset.key(), "textures/ui/button.png");
}

TEST(AssetTest, PathWithoutDirectoryOrExtension) {
    Asset asset("README");
    EXPECT_EQ(asset.directory(), "");
    EXPECT_EQ(asset.name(), "README");
    EXPECT_EQ(asset.extension(), "");
    EXPECT_EQ(asset.longExtension(), "");
}

TEST(AssetTest, LeadingDotBelongsToName) {
    Asset asset("config/.env");
    EXPECT_EQ(asset.name(), ".env");
    EXPECT_EQ(asset.extension(), "");
}

TEST(AssetTest, EveryAssetGetsItsOwnId) {
    Asset a("a.png");
    Asset b("a.png");
    EXPECT_FALSE(a.id().empty());
    EXPECT_NE(a.id(), b.id());
    EXPECT_EQ(a.key(), b.key());
}

TEST(AssetTest, TypeResolvesOnce) {
    Asset asset("a.png");
    EXPECT_EQ(asset.type(), kUnknownAssetType);
    EXPECT_FALSE(asset.hasResolvedType());

    EXPECT_TRUE(asset.resolveType("texture"));
    EXPECT_FALSE(asset.resolveType("image"));
    EXPECT_EQ(asset.type(), "texture");
}

TEST(AssetTest, ExplicitTypeIsAlreadyResolved) {
    Asset asset("data.bin", "blob");
    EXPECT_TRUE(asset.hasResolvedType());
    EXPECT_FALSE(asset.resolveType("other"));
    EXPECT_EQ(asset.type(), "blob");
}
