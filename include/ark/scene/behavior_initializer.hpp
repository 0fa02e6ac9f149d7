#pragma once

/// @file behavior_initializer.hpp
/// @brief Resolves a Behavior's declared properties and dependencies.

#include <cstddef>
#include <string>
#include <vector>

namespace ark::scene {

class Behavior;

/// Outcome of one initialization.
struct BehaviorInitReport {
    std::size_t properties = 0;         ///< declared properties resolved
    std::size_t dependencies = 0;       ///< dependencies bound to a component
    std::vector<std::string> missing;   ///< keys of unresolved dependencies
};

/// Applies a Behavior's registration table.
///
/// Properties keep a value of the declared type and otherwise get the type
/// default (a value of another type is replaced and logged).  Component
/// dependencies bind to the first live sibling of the requested type;
/// misses are logged under LogCategory::Behavior and leave the slot
/// nullptr.  Runs at most once per behavior.
class BehaviorInitializer {
public:
    static BehaviorInitReport Initialize(Behavior& behavior);
};

} // namespace ark::scene
