#include "ark/asset/asset_registry.hpp"

#include <utility>

namespace ark::asset {

namespace {

std::string normalizeExtension(std::string_view ext) {
    if (ext.empty() || ext.front() == '.') {
        return std::string(ext);
    }
    return "." + std::string(ext);
}

} // namespace

void AssetRegistry::registerLoader(std::string type, const std::vector<std::string>& extensions,
                                   AssetLoader loader) {
    for (const auto& ext : extensions) {
        extensionToType_[normalizeExtension(ext)] = type;
    }
    loaders_[std::move(type)] = std::move(loader);
}

std::string AssetRegistry::typeForExtension(std::string_view extension) const {
    auto it = extensionToType_.find(normalizeExtension(extension));
    return it != extensionToType_.end() ? it->second : std::string(kUnknownAssetType);
}

std::string AssetRegistry::typeFor(const Asset& asset) const {
    const auto longExt = asset.longExtension();
    if (!longExt.empty()) {
        auto type = typeForExtension(longExt);
        if (type != kUnknownAssetType) {
            return type;
        }
    }
    if (asset.extension().empty()) {
        return std::string(kUnknownAssetType);
    }
    return typeForExtension(asset.extension());
}

const AssetLoader* AssetRegistry::loaderForType(std::string_view type) const {
    auto it = loaders_.find(std::string(type));
    return it != loaders_.end() ? &it->second : nullptr;
}

} // namespace ark::asset
