#pragma once

/// @file handle.hpp
/// @brief Versioned handles into the scene arenas.
///
/// A handle combines a slot index (24 bits) with a version counter
/// (8 bits).  Releasing a slot bumps its version, so any handle still
/// referring to the old occupant resolves to nullptr instead of a
/// recycled object.

#include <cstdint>
#include <functional>
#include <limits>

namespace ark::scene {

/// Compact handle: 24-bit index + 8-bit version packed into 32 bits.
///
/// @tparam Tag Distinguishes handle families (actors, components) at
///             compile time.
template <typename Tag>
struct Handle {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIndexBits = 24;
    static constexpr uint32_t kVersionBits = 8;
    static constexpr uint32_t kIndexMask = (1u << kIndexBits) - 1;  // 0x00FFFFFF
    static constexpr uint32_t kVersionShift = kIndexBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxIndex = kIndexMask - 1;  // 0x00FFFFFF is reserved

    constexpr Handle() = default;

    constexpr Handle(uint32_t index, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (index & kIndexMask)) {}

    [[nodiscard]] constexpr uint32_t index() const noexcept { return raw & kIndexMask; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Handle invalid() noexcept { return Handle{}; }

    constexpr auto operator<=>(const Handle&) const = default;
};

struct ActorTag {};
struct ComponentTag {};

using ActorHandle = Handle<ActorTag>;
using ComponentHandle = Handle<ComponentTag>;

static_assert(sizeof(ActorHandle) == 4, "Handle must be exactly 32 bits");

} // namespace ark::scene

template <typename Tag>
struct std::hash<ark::scene::Handle<Tag>> {
    std::size_t operator()(const ark::scene::Handle<Tag>& h) const noexcept {
        return std::hash<uint32_t>{}(h.raw);
    }
};
