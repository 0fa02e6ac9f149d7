#include "ark/asset/asset_manager.hpp"

#include "ark/foundation/kernel_logger.hpp"

#include <utility>

namespace ark::asset {

using foundation::ErrorCode;
using foundation::KernelError;
using foundation::KernelResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

AssetManager::AssetManager(foundation::TaskQueue& tasks, AssetLoaderContext context)
    : tasks_(tasks), context_(std::move(context)) {}

// ── Requests ─────────────────────────────────────────────────────────

std::shared_ptr<Asset> AssetManager::enqueue(std::shared_ptr<Asset> asset, std::any options) {
    const auto key = asset->key();
    auto known = byKey_.find(key);
    if (known != byKey_.end()) {
        asset = known->second;
    } else {
        byKey_.emplace(key, asset);
    }
    if (!asset->hasResolvedType()) {
        asset->resolveType(registry_.typeFor(*asset));
    }

    if (foundation::KernelLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Asset)) {
        LogContext ctx;
        ctx.assetId = asset->id();
        ctx.extra["asset"] = key;
        ctx.extra["type"] = asset->type();
        ARK_LOG_CTX(LogLevel::Debug, LogCategory::Asset, "asset requested", ctx);
    }

    const auto& id = asset->id();
    if (results_.count(id) > 0) {
        return asset;
    }
    if (options.has_value()) {
        pendingOptions_.try_emplace(key, std::move(options));
    }
    if (queuedIds_.count(id) > 0) {
        return asset;
    }
    queue_.push_back(asset);
    queuedIds_.insert(id);
    scheduleAutoload();
    return asset;
}

void AssetManager::scheduleAutoload() {
    if (!autoload_ || autoloadScheduled_) {
        return;
    }
    autoloadScheduled_ = true;
    tasks_.post([this]() {
        autoloadScheduled_ = false;
        auto result = flush();
        if (result) {
            ARK_LOG_DEBUG(LogCategory::Asset,
                          "autoload flushed " + std::to_string(result.value()) + " asset(s)");
        }
    });
}

// ── Loading ──────────────────────────────────────────────────────────

KernelResult<std::size_t> AssetManager::flush(const FlushOptions& options) {
    return flush(context_, options);
}

KernelResult<std::size_t> AssetManager::flush(AssetLoaderContext& context,
                                              const FlushOptions& options) {
    std::vector<std::shared_ptr<Asset>> batch;
    batch.swap(queue_);
    if (batch.empty()) {
        return KernelResult<std::size_t>::ok(0);
    }

    ARK_LOG_INFO(LogCategory::Asset, "loading " + std::to_string(batch.size()) + " asset(s)");

    for (std::size_t i = 0; i < batch.size(); ++i) {
        const auto& asset = batch[i];

        const AssetLoader* loader = registry_.loaderForType(asset->type());
        if (loader == nullptr || !*loader) {
            return failBatch(batch, i,
                             KernelError(ErrorCode::LoaderNotRegistered,
                                         "no loader registered for asset type: " + asset->type(),
                                         asset->key()));
        }

        std::any loaderOptions;
        if (auto it = pendingOptions_.find(asset->key()); it != pendingOptions_.end()) {
            loaderOptions = std::move(it->second);
            pendingOptions_.erase(it);
        }

        // A throwing callback or loader still leaves the pending set consistent.
        auto loaded = [&]() {
            try {
                if (options.onStart) {
                    options.onStart(*asset);
                }
                return (*loader)(*asset, context, loaderOptions);
            } catch (...) {
                unqueue(batch, i);
                throw;
            }
        }();
        if (!loaded) {
            return failBatch(batch, i,
                             KernelError(ErrorCode::AssetLoadFailed,
                                         "failed to load asset \"" + asset->key() + "\": " +
                                             std::string(loaded.error().message()),
                                         asset->key()));
        }

        results_[asset->id()] = std::move(loaded).value();
        queuedIds_.erase(asset->id());

        if (options.onProgress) {
            try {
                options.onProgress(i + 1, batch.size());
            } catch (...) {
                unqueue(batch, i + 1);
                throw;
            }
        }
    }

    ARK_LOG_INFO(LogCategory::Asset, "loaded " + std::to_string(batch.size()) + " asset(s)");
    return KernelResult<std::size_t>::ok(batch.size());
}

KernelResult<std::size_t> AssetManager::failBatch(const std::vector<std::shared_ptr<Asset>>& batch,
                                                  std::size_t failedIndex, KernelError error) {
    // The failed asset and everything after it leave the pending set so a
    // later request queues them again.
    unqueue(batch, failedIndex);

    LogContext ctx;
    ctx.assetId = batch[failedIndex]->id();
    ctx.extra["asset"] = batch[failedIndex]->key();
    ctx.extra["dropped"] = std::to_string(batch.size() - failedIndex);
    ARK_LOG_CTX(LogLevel::Error, LogCategory::Asset, std::string(error.message()), ctx);

    flushFailed_.emit(error);
    return KernelResult<std::size_t>::err(std::move(error));
}

void AssetManager::unqueue(const std::vector<std::shared_ptr<Asset>>& batch, std::size_t from) {
    for (std::size_t j = from; j < batch.size(); ++j) {
        queuedIds_.erase(batch[j]->id());
    }
}

// ── Results ──────────────────────────────────────────────────────────

const std::any* AssetManager::find(std::string_view assetId) const {
    auto it = results_.find(std::string(assetId));
    return it != results_.end() ? &it->second : nullptr;
}

bool AssetManager::isLoaded(std::string_view path) const {
    auto asset = assetFor(path);
    return asset != nullptr && results_.count(asset->id()) > 0;
}

std::shared_ptr<const Asset> AssetManager::assetFor(std::string_view path) const {
    // Normalize the same way Asset does.
    const Asset normalized(path);
    auto it = byKey_.find(normalized.key());
    return it != byKey_.end() ? it->second : nullptr;
}

} // namespace ark::asset
