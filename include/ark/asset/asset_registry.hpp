#pragma once

/// @file asset_registry.hpp
/// @brief Loader registry: type tag -> loader, extension -> type tag.

#include "ark/asset/asset.hpp"
#include "ark/foundation/kernel_result.hpp"

#include <any>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ark::asset {

/// Shared state handed to every loader of a flush.
struct AssetLoaderContext {
    /// Directory asset keys are relative to.
    std::filesystem::path rootDirectory;

    /// Host-defined payload (device handles, caches).
    std::any userData;
};

/// Resolves one asset to a value.  Called at most once per asset.
///
/// The third argument carries the options given with the first request
/// for the asset's key, or an empty std::any.
using AssetLoader = std::function<foundation::KernelResult<std::any>(
    const Asset&, AssetLoaderContext&, const std::any&)>;

/// Maps type tags to loaders and file extensions to type tags.
class AssetRegistry {
public:
    AssetRegistry() = default;

    /// Register @p loader for @p type and claim @p extensions for it.
    ///
    /// Re-registering a type replaces its loader; claiming an extension
    /// already mapped to another type moves it to @p type.  Extensions may
    /// be given with or without the leading dot.
    void registerLoader(std::string type, const std::vector<std::string>& extensions,
                        AssetLoader loader);

    /// Type claiming @p extension, or "unknown".
    [[nodiscard]] std::string typeForExtension(std::string_view extension) const;

    /// Type for @p asset by its long extension, then by its last extension.
    [[nodiscard]] std::string typeFor(const Asset& asset) const;

    /// Loader for @p type, or nullptr.
    [[nodiscard]] const AssetLoader* loaderForType(std::string_view type) const;

    [[nodiscard]] std::size_t loaderCount() const noexcept { return loaders_.size(); }

private:
    std::unordered_map<std::string, std::string> extensionToType_;
    std::unordered_map<std::string, AssetLoader> loaders_;
};

} // namespace ark::asset
