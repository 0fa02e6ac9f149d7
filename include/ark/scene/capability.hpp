#pragma once

/// @file capability.hpp
/// @brief Lifecycle hooks a component opts into.

#include <cstdint>

namespace ark::scene {

/// Bit set of lifecycle hooks a component implements.
///
/// The kernel only calls hooks that are declared here.  Update and
/// FixedUpdate also decide, once at attach time, whether the component
/// joins its actor's per-frame list.
enum class Capability : uint8_t {
    None        = 0,
    Attach      = 1 << 0,
    Start       = 1 << 1,
    Update      = 1 << 2,
    FixedUpdate = 1 << 3,
    Destroy     = 1 << 4,
    LayerChange = 1 << 5,
    All         = 0x3F
};

constexpr Capability operator|(Capability lhs, Capability rhs) noexcept {
    return static_cast<Capability>(static_cast<uint8_t>(lhs) | static_cast<uint8_t>(rhs));
}

constexpr Capability operator&(Capability lhs, Capability rhs) noexcept {
    return static_cast<Capability>(static_cast<uint8_t>(lhs) & static_cast<uint8_t>(rhs));
}

/// True if @p set contains every bit of @p flag.
constexpr bool hasCapability(Capability set, Capability flag) noexcept {
    return (set & flag) == flag && flag != Capability::None;
}

/// True if @p set asks for per-frame work.
constexpr bool needsFrameWork(Capability set) noexcept {
    return hasCapability(set, Capability::Update) || hasCapability(set, Capability::FixedUpdate);
}

} // namespace ark::scene
