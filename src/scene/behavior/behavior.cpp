/// @file behavior.cpp
/// @brief Behavior property bag.

#include "ark/scene/behavior.hpp"

#include "ark/scene/behavior_initializer.hpp"

#include <utility>

namespace ark::scene {

PropertyValue defaultPropertyValue(PropertyType type) {
    switch (type) {
        case PropertyType::String:      return std::string{};
        case PropertyType::StringList:  return std::vector<std::string>{};
        case PropertyType::Number:      return 0.0;
        case PropertyType::NumberList:  return std::vector<double>{};
        case PropertyType::Boolean:     return false;
        case PropertyType::BooleanList: return std::vector<bool>{};
        case PropertyType::Vector2:     return foundation::Vector2{};
        case PropertyType::Vector3:     return foundation::Vector3{};
    }
    return std::string{};
}

std::string_view propertyTypeName(PropertyType type) noexcept {
    switch (type) {
        case PropertyType::String:      return "string";
        case PropertyType::StringList:  return "string[]";
        case PropertyType::Number:      return "number";
        case PropertyType::NumberList:  return "number[]";
        case PropertyType::Boolean:     return "boolean";
        case PropertyType::BooleanList: return "boolean[]";
        case PropertyType::Vector2:     return "Vector2";
        case PropertyType::Vector3:     return "Vector3";
    }
    return "unknown";
}

Behavior::Behavior(Actor& actor, std::string typeName, Capability capabilities)
    : Component(actor, std::move(typeName), capabilities) {}

void Behavior::SetProperty(const std::string& name, PropertyValue value) {
    properties_[name] = std::move(value);
}

bool Behavior::HasProperty(const std::string& name) const {
    return properties_.count(name) > 0;
}

void Behavior::DeclareProperty(std::string name, PropertyType type) {
    declaredProperties_.push_back({std::move(name), type});
}

void Behavior::PrepareAttach() {
    BehaviorInitializer::Initialize(*this);
}

} // namespace ark::scene
