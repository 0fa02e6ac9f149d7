/// @file scene_manager.cpp
/// @brief Actor creation, start flush, per-frame dispatch and reaping.

#include "ark/scene/scene_manager.hpp"

#include "ark/foundation/kernel_logger.hpp"

#include <algorithm>

namespace ark::scene {

using foundation::ErrorCode;
using foundation::KernelError;
using foundation::KernelResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

SceneManager::SceneManager() : tree_(*this, nullptr) {}

SceneManager::~SceneManager() = default;

// ── Actors ───────────────────────────────────────────────────────────

KernelResult<Actor*> SceneManager::CreateActor(std::string name, Actor* parent,
                                               ActorOptions options) {
    if (name.empty()) {
        return KernelResult<Actor*>::err(
            KernelError(ErrorCode::InvalidArgument, "actor name must not be empty"));
    }
    if (parent != nullptr) {
        if (&parent->Manager() != this) {
            return KernelResult<Actor*>::err(
                KernelError(ErrorCode::InvalidArgument,
                            "parent " + parent->ToString() + " belongs to another scene"));
        }
        if (parent->IsPendingForDestruction()) {
            return KernelResult<Actor*>::err(
                KernelError(ErrorCode::ActorPendingDestruction,
                            "cannot add actor to a parent pending destruction: " +
                                parent->ToString()));
        }
    }

    const auto id = actorIds_.next();
    std::unique_ptr<Actor> owned(
        new Actor(*this, std::move(name), id, persistentIds_.next(), std::move(options)));
    Actor* actor = owned.get();
    actor->handle_ = actors_.Insert(std::move(owned));

    if (parent != nullptr) {
        actor->parent_ = parent->GetHandle();
        parent->Add(*actor);
    } else {
        tree_.Add(*actor);
    }

    if (foundation::KernelLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Scene)) {
        LogContext ctx;
        ctx.actorId = actor->Id();
        ctx.extra["name"] = actor->Name();
        ARK_LOG_CTX(LogLevel::Debug, LogCategory::Scene, "actor created", ctx);
    }
    return KernelResult<Actor*>::ok(actor);
}

// ── Components ───────────────────────────────────────────────────────

void SceneManager::DestroyComponent(Component& component) {
    if (component.pendingForDestruction_ || component.destroyed_ || component.detached_) {
        return;
    }
    component.pendingForDestruction_ = true;
    DequeueStart(component.GetHandle());
    toBeDestroyed_.push_back(component.GetHandle());
}

ComponentHandle SceneManager::InsertComponent(std::unique_ptr<Component> component) {
    return components_.Insert(std::move(component));
}

void SceneManager::EnqueueStart(ComponentHandle handle) {
    toBeStarted_.push_back(handle);
}

void SceneManager::DequeueStart(ComponentHandle handle) {
    toBeStarted_.erase(std::remove(toBeStarted_.begin(), toBeStarted_.end(), handle),
                       toBeStarted_.end());
}

void SceneManager::AdoptOrphan(ComponentHandle handle) {
    orphans_.push_back(handle);
}

void SceneManager::ReleaseComponent(ComponentHandle handle) {
    // Destroyed here, outside every list that could still reach it.
    auto released = components_.Release(handle);
    released.reset();
}

// ── Frame phases ─────────────────────────────────────────────────────

namespace {

bool canStart(const Component* component) {
    if (component == nullptr || component->IsPendingForDestruction() ||
        component->IsDestroyed() || component->IsDetached()) {
        return false;
    }
    const Actor& actor = component->GetActor();
    return !actor.IsPendingForDestruction() && !actor.IsDestroyed();
}

} // namespace

std::size_t SceneManager::FlushStarts() {
    std::size_t started = 0;

    while (!toBeStarted_.empty()) {
        std::vector<ComponentHandle> batch;
        batch.swap(toBeStarted_);

        // Pass 1: wire and attach the whole batch.
        for (const auto handle : batch) {
            auto* component = Resolve(handle);
            if (!canStart(component)) {
                continue;
            }
            component->PrepareAttach();
            if (component->Has(Capability::Attach)) {
                component->OnAttach();
            }
            component->attached_ = true;
        }

        // Pass 2: start everything that attached.
        for (const auto handle : batch) {
            auto* component = Resolve(handle);
            if (!canStart(component) || !component->attached_ || component->started_) {
                continue;
            }
            if (component->Has(Capability::Start)) {
                component->OnStart();
            }
            component->started_ = true;
            ++started;
        }
    }

    cachedActors_.clear();
    tree_.Visit([this](Actor& actor, Actor*) {
        if (actor.IsPendingForDestruction()) {
            return false;
        }
        cachedActors_.push_back(actor.GetHandle());
        return true;
    });

    if (started > 0) {
        ARK_LOG_DEBUG(LogCategory::Scene,
                      "started " + std::to_string(started) + " component(s)");
    }
    return started;
}

void SceneManager::FixedUpdate(double stepMs) {
    for (const auto handle : cachedActors_) {
        if (auto* actor = Resolve(handle)) {
            actor->FixedUpdate(stepMs);
        }
    }
}

void SceneManager::Update(double deltaMs) {
    for (const auto handle : cachedActors_) {
        if (auto* actor = Resolve(handle)) {
            actor->Update(deltaMs);
        }
    }
}

ReapStats SceneManager::Reap() {
    ReapStats stats;

    // Individually destroyed components.
    while (!toBeDestroyed_.empty()) {
        std::vector<ComponentHandle> batch;
        batch.swap(toBeDestroyed_);
        for (const auto handle : batch) {
            auto* component = Resolve(handle);
            if (component == nullptr) {
                continue;
            }
            component->RunDestroy();
            if (!component->IsDetached()) {
                component->GetActor().DetachComponent(handle);
            }
            ReleaseComponent(handle);
            ++stats.components;
        }
    }

    // Pending actors, in depth-first order.  Slots are released after the
    // sweep so parents stay resolvable while their children detach.
    std::vector<ActorHandle> doomed;
    tree_.Visit([&doomed](Actor& actor, Actor*) {
        if (actor.IsPendingForDestruction()) {
            doomed.push_back(actor.GetHandle());
        }
        return true;
    });

    for (const auto handle : doomed) {
        auto* actor = Resolve(handle);
        if (actor == nullptr) {
            continue;
        }
        if (auto* parent = actor->Parent()) {
            parent->Remove(*actor);
        } else {
            tree_.Remove(*actor);
        }
        actor->Destroy();
        ++stats.actors;
    }
    for (const auto handle : doomed) {
        auto released = actors_.Release(handle);
        released.reset();
    }

    // Nothing queued for start may outlive its actor.
    toBeStarted_.erase(std::remove_if(toBeStarted_.begin(), toBeStarted_.end(),
                                      [this](ComponentHandle handle) {
                                          const auto* component = Resolve(handle);
                                          return component == nullptr ||
                                                 component->IsDestroyed() ||
                                                 component->IsDetached();
                                      }),
                       toBeStarted_.end());

    // Components taken off their actor without destruction.
    const auto orphans = std::move(orphans_);
    orphans_.clear();
    for (const auto handle : orphans) {
        ReleaseComponent(handle);
    }

    if (stats.actors > 0 || stats.components > 0) {
        ARK_LOG_DEBUG(LogCategory::Scene,
                      "reaped " + std::to_string(stats.actors) + " actor(s), " +
                          std::to_string(stats.components) + " component(s)");
    }
    return stats;
}

} // namespace ark::scene
