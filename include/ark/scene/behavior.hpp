#pragma once

/// @file behavior.hpp
/// @brief Scriptable component with a typed property bag and declared
///        sibling-component dependencies.

#include "ark/foundation/math_types.hpp"
#include "ark/scene/actor.hpp"
#include "ark/scene/component.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ark::scene {

/// Kinds of values a behavior property can hold.  The order matches the
/// alternatives of PropertyValue.
enum class PropertyType : uint8_t {
    String = 0,
    StringList,
    Number,
    NumberList,
    Boolean,
    BooleanList,
    Vector2,
    Vector3
};

using PropertyValue = std::variant<std::string,
                                   std::vector<std::string>,
                                   double,
                                   std::vector<double>,
                                   bool,
                                   std::vector<bool>,
                                   foundation::Vector2,
                                   foundation::Vector3>;

[[nodiscard]] constexpr PropertyType propertyTypeOf(const PropertyValue& value) noexcept {
    return static_cast<PropertyType>(value.index());
}

/// Value a declared property takes when nothing was set: "", 0, false,
/// empty list or the zero vector.
[[nodiscard]] PropertyValue defaultPropertyValue(PropertyType type);

[[nodiscard]] std::string_view propertyTypeName(PropertyType type) noexcept;

class BehaviorInitializer;

/// Hooks every behavior gets without asking.  Per-frame hooks are opted
/// into explicitly so idle behaviors stay off the per-frame list.
inline constexpr Capability kBehaviorCapabilities =
    Capability::Attach | Capability::Start | Capability::Destroy;

/// Component base for game logic.
///
/// A behavior declares what it needs in its constructor; the
/// BehaviorInitializer resolves the declarations once, right before
/// OnAttach, so values set by the creator in between are kept:
///
/// @code
///   class Follower : public Behavior {
///   public:
///       explicit Follower(Actor& actor)
///           : Behavior(actor, "Follower", kBehaviorCapabilities | Capability::Update) {
///           DeclareProperty("speed", PropertyType::Number);
///           RequireComponent<Body>("body", body_);
///       }
///       void OnUpdate(double dt) override {
///           if (body_ != nullptr) {
///               body_->Move(GetProperty("speed", 1.0) * dt);
///           }
///       }
///   private:
///       Body* body_ = nullptr;
///   };
///
///   actor.AddComponentWith<Follower>([](Follower& f) { f.SetProperty("speed", 4.0); });
/// @endcode
///
/// A missing dependency is logged as a warning and leaves its slot
/// nullptr; the behavior must check it.
class Behavior : public Component {
public:
    Behavior(Actor& actor, std::string typeName,
             Capability capabilities = kBehaviorCapabilities);
    ~Behavior() override = default;

    // ── Properties ──────────────────────────────────────────────────

    void SetProperty(const std::string& name, PropertyValue value);
    void SetProperty(const std::string& name, const char* value) {
        SetProperty(name, PropertyValue(std::string(value)));
    }

    /// The property value if set and of type T, otherwise @p fallback.
    template <typename T>
    [[nodiscard]] T GetProperty(const std::string& name, T fallback) const {
        auto it = properties_.find(name);
        if (it == properties_.end()) {
            return fallback;
        }
        if (const auto* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        return fallback;
    }

    [[nodiscard]] std::string GetProperty(const std::string& name, const char* fallback) const {
        return GetProperty<std::string>(name, std::string(fallback));
    }

    [[nodiscard]] bool HasProperty(const std::string& name) const;

    [[nodiscard]] const std::map<std::string, PropertyValue>& Properties() const noexcept {
        return properties_;
    }

    /// True once the BehaviorInitializer ran.
    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

protected:
    /// Declare a property; after initialization it holds the value set by
    /// the creator, or the type default.
    void DeclareProperty(std::string name, PropertyType type);

    /// Declare a dependency on a sibling component of type T, written to
    /// @p slot during initialization.
    template <typename T>
    void RequireComponent(std::string key, T*& slot);

private:
    friend class BehaviorInitializer;

    struct PropertyDeclaration {
        std::string name;
        PropertyType type;
    };

    struct ComponentDependency {
        std::string key;
        std::function<bool(Behavior&)> resolve;
    };

    void PrepareAttach() override;

    std::map<std::string, PropertyValue> properties_;
    std::vector<PropertyDeclaration> declaredProperties_;
    std::vector<ComponentDependency> dependencies_;
    bool initialized_ = false;
};

// --- Template implementations ---

template <typename T>
void Behavior::RequireComponent(std::string key, T*& slot) {
    static_assert(std::is_base_of_v<Component, T>, "dependency must be a Component");
    slot = nullptr;
    dependencies_.push_back({std::move(key), [&slot](Behavior& self) {
        for (T* candidate : self.GetActor().template GetComponents<T>()) {
            if (static_cast<Component*>(candidate) != static_cast<Component*>(&self)) {
                slot = candidate;
                return true;
            }
        }
        slot = nullptr;
        return false;
    }});
}

} // namespace ark::scene
