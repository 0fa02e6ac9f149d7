#pragma once

/// @file lazy_asset.hpp
/// @brief Handle to a requested asset whose value may not be loaded yet.

#include "ark/asset/asset.hpp"
#include "ark/foundation/kernel_result.hpp"

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace ark::asset {

/// Pair of an asset and an accessor into the manager's result table.
///
/// get() never waits: before the asset is loaded it fails with
/// AssetNotReady.  Read it from a hook that runs after the flush, e.g.
/// OnStart of a scene whose assets were flushed before awake.
///
/// @code
///   auto texture = assets.request<Texture>("sprites/hero.png");
///   ...
///   auto tex = texture.get();
///   if (!tex) {
///       return tex.error();
///   }
/// @endcode
///
/// The handle must not outlive the AssetManager that issued it.
template <typename T>
class LazyAsset {
public:
    using Accessor = std::function<const std::any*()>;

    LazyAsset(std::shared_ptr<const Asset> asset, Accessor accessor)
        : asset_(std::move(asset)), accessor_(std::move(accessor)) {}

    [[nodiscard]] const Asset& asset() const noexcept { return *asset_; }
    [[nodiscard]] std::shared_ptr<const Asset> assetPtr() const noexcept { return asset_; }

    [[nodiscard]] bool isReady() const { return accessor_() != nullptr; }

    /// Copy of the loaded value.
    ///
    /// Fails with AssetNotReady before the value is in the result table and
    /// with AssetTypeMismatch if the loader produced something other than T.
    [[nodiscard]] foundation::KernelResult<T> get() const {
        using foundation::ErrorCode;
        using foundation::KernelError;

        const std::any* value = accessor_();
        if (value == nullptr) {
            return foundation::KernelResult<T>::err(
                KernelError(ErrorCode::AssetNotReady,
                            "asset \"" + asset_->key() + "\" is not yet loaded",
                            asset_->id()));
        }
        if (const T* typed = std::any_cast<T>(value)) {
            return foundation::KernelResult<T>::ok(*typed);
        }
        return foundation::KernelResult<T>::err(
            KernelError(ErrorCode::AssetTypeMismatch,
                        "asset \"" + asset_->key() + "\" holds a different type",
                        asset_->id()));
    }

    /// Loaded value without copying, or nullptr (not ready or other type).
    [[nodiscard]] const T* tryGet() const {
        const std::any* value = accessor_();
        return value != nullptr ? std::any_cast<T>(value) : nullptr;
    }

private:
    std::shared_ptr<const Asset> asset_;
    Accessor accessor_;
};

} // namespace ark::asset
