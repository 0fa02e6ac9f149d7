#pragma once

/// @file renderer.hpp
/// @brief Draw hook the World calls after a frame with logical updates.

#include <cstdint>

namespace ark::scene {
class SceneManager;
}

namespace ark::runtime {

/// What a renderer sees of one frame.
struct FrameContext {
    uint64_t frame = 0;

    /// Variable delta the frame was updated with, in milliseconds.
    double deltaMs = 0.0;

    /// Fixed steps run this frame (always > 0 when draw() is called).
    uint32_t updates = 0;

    /// Fraction of the next fixed step already elapsed.
    double interpolation = 0.0;

    const scene::SceneManager* scenes = nullptr;
};

/// Renderer collaborator.  Frames without fixed updates are not drawn.
class IRenderer {
public:
    virtual ~IRenderer() = default;

    virtual void draw(const FrameContext& frame) = 0;
};

} // namespace ark::runtime
