#pragma once

/// @file asset_manager.hpp
/// @brief Request queue, batch flush and result table for assets.

#include "ark/asset/asset.hpp"
#include "ark/asset/asset_registry.hpp"
#include "ark/asset/lazy_asset.hpp"
#include "ark/foundation/kernel_result.hpp"
#include "ark/foundation/signal.hpp"
#include "ark/foundation/task_queue.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ark::asset {

/// Callbacks for one flush.
struct FlushOptions {
    /// Before an asset's loader runs.
    std::function<void(const Asset&)> onStart;

    /// After an asset was stored: (loaded so far, batch size).
    std::function<void(std::size_t, std::size_t)> onProgress;
};

/// Collects asset requests and resolves them in batches.
///
/// request() returns a LazyAsset at once and queues the asset.  flush()
/// takes the whole queue, so requests made while a flush runs form the
/// next batch.  Assets are resolved one after another in request order;
/// the first failure (no loader for the type, or a loader error) ends the
/// batch.  Values stored for earlier assets of that batch stay valid, the
/// remaining assets are dropped and may be requested again.
///
/// A loader that throws ends the batch the same way before the exception
/// propagates.
///
/// With autoload on, the first request after a flush posts one flush task
/// to the TaskQueue; every request made before the queue is drained joins
/// that flush.
///
/// Kernel-thread only.  The TaskQueue must not run a posted flush after
/// the manager is destroyed.
class AssetManager {
public:
    explicit AssetManager(foundation::TaskQueue& tasks, AssetLoaderContext context = {});

    AssetManager(const AssetManager&) = delete;
    AssetManager& operator=(const AssetManager&) = delete;

    [[nodiscard]] AssetRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const AssetRegistry& registry() const noexcept { return registry_; }

    // ── Requests ────────────────────────────────────────────────────

    /// Request the asset at @p path.  @p options reach the loader; only the
    /// first non-empty options given for a key before it loads are kept.
    template <typename T>
    [[nodiscard]] LazyAsset<T> request(std::string_view path, std::any options = {}) {
        return makeLazy<T>(enqueue(std::make_shared<Asset>(path), std::move(options)));
    }

    template <typename T>
    [[nodiscard]] LazyAsset<T> request(std::shared_ptr<Asset> asset, std::any options = {}) {
        return makeLazy<T>(enqueue(std::move(asset), std::move(options)));
    }

    /// Queue @p asset unless an asset with the same key is already known,
    /// resolving an unknown type from the registry.  Returns the asset
    /// that represents the key.
    std::shared_ptr<Asset> enqueue(std::shared_ptr<Asset> asset, std::any options = {});

    // ── Loading ─────────────────────────────────────────────────────

    /// Resolve the current queue with the manager's context.
    /// @return Number of assets loaded, or the error that ended the batch.
    foundation::KernelResult<std::size_t> flush(const FlushOptions& options = {});

    /// Resolve the current queue with @p context.
    foundation::KernelResult<std::size_t> flush(AssetLoaderContext& context,
                                                const FlushOptions& options = {});

    // ── Results ─────────────────────────────────────────────────────

    /// Loaded value for an asset id, or nullptr.
    [[nodiscard]] const std::any* find(std::string_view assetId) const;

    /// True if the asset known under @p path has been loaded.
    [[nodiscard]] bool isLoaded(std::string_view path) const;

    /// Asset known under @p path, or nullptr.
    [[nodiscard]] std::shared_ptr<const Asset> assetFor(std::string_view path) const;

    [[nodiscard]] std::size_t pendingCount() const noexcept { return queue_.size(); }
    [[nodiscard]] std::size_t loadedCount() const noexcept { return results_.size(); }

    // ── Settings ────────────────────────────────────────────────────

    void setAutoload(bool enabled) noexcept { autoload_ = enabled; }
    [[nodiscard]] bool autoload() const noexcept { return autoload_; }

    void setContext(AssetLoaderContext context) { context_ = std::move(context); }
    [[nodiscard]] AssetLoaderContext& context() noexcept { return context_; }

    /// Fires with the error that ended a batch.
    [[nodiscard]] foundation::Signal<const foundation::KernelError&>& flushFailed() noexcept {
        return flushFailed_;
    }

private:
    template <typename T>
    LazyAsset<T> makeLazy(std::shared_ptr<Asset> asset) {
        auto id = asset->id();
        return LazyAsset<T>(std::move(asset), [this, id]() { return find(id); });
    }

    void scheduleAutoload();

    foundation::KernelResult<std::size_t> failBatch(const std::vector<std::shared_ptr<Asset>>& batch,
                                                    std::size_t failedIndex,
                                                    foundation::KernelError error);

    /// Drop batch[from..] from the pending set.
    void unqueue(const std::vector<std::shared_ptr<Asset>>& batch, std::size_t from);

    foundation::TaskQueue& tasks_;
    AssetLoaderContext context_;
    AssetRegistry registry_;

    std::vector<std::shared_ptr<Asset>> queue_;
    std::unordered_set<std::string> queuedIds_;
    std::unordered_map<std::string, std::shared_ptr<Asset>> byKey_;
    std::unordered_map<std::string, std::any> pendingOptions_;
    std::unordered_map<std::string, std::any> results_;

    bool autoload_ = false;
    bool autoloadScheduled_ = false;
    foundation::Signal<const foundation::KernelError&> flushFailed_;
};

} // namespace ark::asset
