#include <gtest/gtest.h>

#include <any>
#include <string>

#include "ark/asset/asset_registry.hpp"

using namespace ark::asset;
using ark::foundation::KernelResult;

namespace {

AssetLoader constantLoader(std::string value) {
    return [value](const Asset&, AssetLoaderContext&, const std::any&) {
        return KernelResult<std::any>::ok(std::any(value));
    };
}

std::string runLoader(const AssetLoader& loader, const Asset& asset) {
    AssetLoaderContext context;
    auto result = loader(asset, context, std::any{});
    EXPECT_TRUE(result.hasValue());
    return std::any_cast<std::string>(result.value());
}

} // namespace

TEST(AssetRegistryTest, UnknownExtensionYieldsUnknownType) {
    AssetRegistry registry;
    EXPECT_EQ(registry.typeForExtension(".png"), kUnknownAssetType);
    EXPECT_EQ(registry.typeFor(Asset("a.png")), kUnknownAssetType);
    EXPECT_EQ(registry.loaderForType("texture"), nullptr);
}

TEST(AssetRegistryTest, ExtensionsMayOmitLeadingDot) {
    AssetRegistry registry;
    registry.registerLoader("texture", {"png", ".jpg"}, constantLoader("tex"));

    EXPECT_EQ(registry.typeForExtension(".png"), "texture");
    EXPECT_EQ(registry.typeForExtension("jpg"), "texture");
    EXPECT_EQ(registry.typeFor(Asset("sprites/hero.png")), "texture");
    EXPECT_EQ(registry.loaderCount(), 1u);
}

TEST(AssetRegistryTest, LongExtensionWinsOverLastExtension) {
    AssetRegistry registry;
    registry.registerLoader("model", {".glb"}, constantLoader("model"));
    registry.registerLoader("skin", {".skin.glb"}, constantLoader("skin"));

    EXPECT_EQ(registry.typeFor(Asset("hero.skin.glb")), "skin");
    EXPECT_EQ(registry.typeFor(Asset("hero.glb")), "model");
    EXPECT_EQ(registry.typeFor(Asset("hero.lod.glb")), "model");
}

TEST(AssetRegistryTest, LastRegistrationWins) {
    AssetRegistry registry;
    registry.registerLoader("text", {".txt"}, constantLoader("first"));
    registry.registerLoader("text", {".md"}, constantLoader("second"));

    const auto* loader = registry.loaderForType("text");
    ASSERT_NE(loader, nullptr);
    EXPECT_EQ(runLoader(*loader, Asset("a.txt")), "second");
    EXPECT_EQ(registry.loaderCount(), 1u);
    EXPECT_EQ(registry.typeForExtension(".txt"), "text");
}

TEST(AssetRegistryTest, ExtensionMovesToLatestClaimant) {
    AssetRegistry registry;
    registry.registerLoader("plain", {".txt"}, constantLoader("plain"));
    registry.registerLoader("script", {".txt"}, constantLoader("script"));

    EXPECT_EQ(registry.typeForExtension(".txt"), "script");
    EXPECT_NE(registry.loaderForType("plain"), nullptr);
}
