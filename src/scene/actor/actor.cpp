/// @file actor.cpp
/// @brief Actor component management, per-frame dispatch and teardown.

#include "ark/scene/actor.hpp"

#include "ark/foundation/kernel_logger.hpp"
#include "ark/scene/behavior.hpp"
#include "ark/scene/scene_manager.hpp"

#include <algorithm>

namespace ark::scene {

using foundation::ErrorCode;
using foundation::KernelError;
using foundation::KernelResult;

namespace {

void eraseHandle(std::vector<ComponentHandle>& list, ComponentHandle handle) {
    list.erase(std::remove(list.begin(), list.end(), handle), list.end());
}

} // namespace

Actor::Actor(SceneManager& manager, std::string name, uint64_t id,
             std::string persistentId, ActorOptions options)
    : ActorTree(manager, this),
      name_(std::move(name)),
      id_(id),
      persistentId_(std::move(persistentId)),
      visible_(options.visible),
      layers_(std::move(options.layers)) {}

std::string Actor::ToString() const {
    return name_ + ":" + std::to_string(id_) + "-" + persistentId_;
}

bool Actor::InLayer(uint32_t layer) const noexcept {
    return std::find(layers_.begin(), layers_.end(), layer) != layers_.end();
}

// ── Placement ────────────────────────────────────────────────────────

Actor* Actor::Parent() const noexcept {
    return Manager().Resolve(parent_);
}

KernelResult<void> Actor::SetParent(Actor* newParent) {
    if (pendingForDestruction_) {
        return KernelResult<void>::err(
            KernelError(ErrorCode::ActorPendingDestruction,
                        "cannot re-parent actor pending destruction: " + ToString()));
    }
    if (newParent != nullptr && newParent->IsPendingForDestruction()) {
        return KernelResult<void>::err(
            KernelError(ErrorCode::ActorPendingDestruction,
                        "cannot re-parent under actor pending destruction: " +
                            newParent->ToString()));
    }
    for (auto* cursor = newParent; cursor != nullptr; cursor = cursor->Parent()) {
        if (cursor == this) {
            return KernelResult<void>::err(
                KernelError(ErrorCode::InvalidArgument,
                            "re-parenting " + ToString() + " would create a cycle"));
        }
    }

    ActorTree& oldSiblings = Parent() != nullptr ? static_cast<ActorTree&>(*Parent())
                                                 : Manager().Tree();
    oldSiblings.Remove(*this);

    parent_ = newParent != nullptr ? newParent->GetHandle() : ActorHandle::invalid();
    ActorTree& newSiblings = newParent != nullptr ? static_cast<ActorTree&>(*newParent)
                                                  : Manager().Tree();
    newSiblings.Add(*this);
    return KernelResult<void>::ok();
}

// ── Components ───────────────────────────────────────────────────────

void Actor::AttachComponent(std::unique_ptr<Component> component) {
    auto& manager = Manager();
    Component& ref = *component;
    ref.id_ = manager.componentIds_.next();
    ref.persistentId_ = manager.persistentIds_.next();

    const auto handle = manager.InsertComponent(std::move(component));
    ref.handle_ = handle;

    if (destroyed_ && !tearingDown_) {
        // Nothing will ever start or destroy it; the next reap frees it.
        ref.detached_ = true;
        manager.AdoptOrphan(handle);
        return;
    }

    components_.push_back(handle);
    if (needsFrameWork(ref.Capabilities())) {
        componentsRequiringUpdate_.push_back(handle);
    }
    if (dynamic_cast<Behavior*>(&ref) != nullptr) {
        behaviors_[ref.TypeName()].push_back(handle);
    }
    manager.EnqueueStart(handle);
}

void Actor::DetachComponent(ComponentHandle handle) {
    eraseHandle(components_, handle);
    eraseHandle(componentsRequiringUpdate_, handle);
    for (auto it = behaviors_.begin(); it != behaviors_.end();) {
        eraseHandle(it->second, handle);
        it = it->second.empty() ? behaviors_.erase(it) : std::next(it);
    }
}

Component* Actor::ResolveComponent(ComponentHandle handle) const noexcept {
    return Manager().Resolve(handle);
}

Component* Actor::GetComponent(std::string_view typeName) const {
    for (const auto handle : components_) {
        auto* component = ResolveComponent(handle);
        if (component != nullptr && !component->IsPendingForDestruction() &&
            component->TypeName() == typeName) {
            return component;
        }
    }
    return nullptr;
}

std::vector<Component*> Actor::Components() const {
    std::vector<Component*> out;
    out.reserve(components_.size());
    for (const auto handle : components_) {
        if (auto* component = ResolveComponent(handle)) {
            out.push_back(component);
        }
    }
    return out;
}

std::vector<Behavior*> Actor::GetBehaviors(std::string_view typeName) const {
    std::vector<Behavior*> out;
    auto it = behaviors_.find(std::string(typeName));
    if (it == behaviors_.end()) {
        return out;
    }
    for (const auto handle : it->second) {
        auto* behavior = static_cast<Behavior*>(ResolveComponent(handle));
        if (behavior != nullptr && !behavior->IsPendingForDestruction()) {
            out.push_back(behavior);
        }
    }
    return out;
}

bool Actor::RemoveComponent(Component& component) {
    if (&component.GetActor() != this) {
        return false;
    }
    const auto handle = component.GetHandle();
    if (std::find(components_.begin(), components_.end(), handle) == components_.end()) {
        return false;
    }
    DetachComponent(handle);
    component.detached_ = true;
    Manager().DequeueStart(handle);
    Manager().AdoptOrphan(handle);
    return true;
}

// ── Per-frame work ───────────────────────────────────────────────────

void Actor::Update(double deltaMs) {
    if (pendingForDestruction_) {
        return;
    }
    const auto snapshot = componentsRequiringUpdate_;
    for (const auto handle : snapshot) {
        auto* component = ResolveComponent(handle);
        if (component == nullptr || !component->IsStarted() ||
            component->IsPendingForDestruction() || !component->Has(Capability::Update)) {
            continue;
        }
        component->OnUpdate(deltaMs);
    }
}

void Actor::FixedUpdate(double stepMs) {
    if (pendingForDestruction_) {
        return;
    }
    const auto snapshot = componentsRequiringUpdate_;
    for (const auto handle : snapshot) {
        auto* component = ResolveComponent(handle);
        if (component == nullptr || !component->IsStarted() ||
            component->IsPendingForDestruction() || !component->Has(Capability::FixedUpdate)) {
            continue;
        }
        component->OnFixedUpdate(stepMs);
    }
}

void Actor::SetActiveLayer(std::optional<uint32_t> layer) {
    const bool active = !layer.has_value() || InLayer(*layer);
    const auto snapshot = components_;
    for (const auto handle : snapshot) {
        auto* component = ResolveComponent(handle);
        if (component != nullptr && component->Has(Capability::LayerChange)) {
            component->OnLayerChange(active);
        }
    }
}

// ── Destruction ──────────────────────────────────────────────────────

void Actor::MarkDestructionPending() {
    if (pendingForDestruction_) {
        return;
    }
    pendingForDestruction_ = true;
    destructionPending_.emit(*this);

    const auto children = ChildHandles();
    for (const auto handle : children) {
        if (auto* child = Manager().Resolve(handle)) {
            child->MarkDestructionPending();
        }
    }
}

void Actor::Destroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    tearingDown_ = true;

    // Hooks may detach components (their own or others); the snapshot keeps
    // every component present now in line for exactly one OnDestroy.
    std::vector<ComponentHandle> released = components_;
    for (auto it = released.rbegin(); it != released.rend(); ++it) {
        if (auto* component = ResolveComponent(*it)) {
            component->RunDestroy();
        }
    }

    // Components attached by those hooks are torn down too, until a pass
    // attaches nothing new.
    for (;;) {
        std::vector<ComponentHandle> fresh;
        for (const auto handle : components_) {
            if (std::find(released.begin(), released.end(), handle) == released.end()) {
                fresh.push_back(handle);
            }
        }
        if (fresh.empty()) {
            break;
        }
        released.insert(released.end(), fresh.begin(), fresh.end());
        for (const auto handle : fresh) {
            if (auto* component = ResolveComponent(handle)) {
                component->RunDestroy();
            }
        }
    }
    tearingDown_ = false;

    components_.clear();
    componentsRequiringUpdate_.clear();
    behaviors_.clear();

    auto& manager = Manager();
    for (const auto handle : released) {
        manager.DequeueStart(handle);
        manager.ReleaseComponent(handle);
    }
}

} // namespace ark::scene
