/// @file component.cpp
/// @brief Component base implementation.

#include "ark/scene/component.hpp"

#include "ark/scene/actor.hpp"
#include "ark/scene/scene_manager.hpp"

#include <utility>

namespace ark::scene {

Component::Component(Actor& actor, std::string typeName, Capability capabilities)
    : actor_(&actor),
      manager_(&actor.Manager()),
      typeName_(std::move(typeName)),
      capabilities_(capabilities) {}

void Component::Destroy() {
    manager_->DestroyComponent(*this);
}

std::string Component::ToString() const {
    return typeName_ + ":" + std::to_string(id_) + "-" + persistentId_;
}

void Component::RunDestroy() {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    if (Has(Capability::Destroy)) {
        OnDestroy();
    }
}

} // namespace ark::scene
