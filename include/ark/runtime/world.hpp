#pragma once

/// @file world.hpp
/// @brief Composition root running one kernel frame per tick().

#include "ark/asset/asset_manager.hpp"
#include "ark/foundation/kernel_config.hpp"
#include "ark/foundation/kernel_result.hpp"
#include "ark/foundation/task_queue.hpp"
#include "ark/runtime/fixed_time_step.hpp"
#include "ark/runtime/renderer.hpp"
#include "ark/runtime/scene.hpp"
#include "ark/scene/scene_manager.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ark::runtime {

/// Outcome of one World::tick().
struct FrameResult {
    /// Frame number, starting at 0.
    uint64_t frame = 0;

    /// Fixed steps run this frame.
    uint32_t updates = 0;

    /// Time left in the fixed-step accumulator, in milliseconds.
    double timeLeft = 0.0;

    /// Fraction of the next fixed step already elapsed.
    double interpolation = 0.0;

    /// True if the renderer was asked to draw.
    bool rendered = false;
};

/// Owns the kernel services and runs frames.
///
/// Each tick() runs, in this order:
///  1. queued tasks (asset flushes, scene loading)
///  2. delta clamping
///  3. Scene::start() if the active scene has just awoken
///  4. SceneManager::FlushStarts()
///  5. zero or more fixed steps
///  6. one variable update
///  7. SceneManager::Reap()
///  8. IRenderer::draw(), only if step 5 ran at least once
///
/// Destruction requested during steps 5 and 6 takes effect in step 7.
/// Exceptions thrown by components or scenes are not caught.
///
/// Kernel-thread only, except tasks() which accepts posts from any thread.
class World {
public:
    explicit World(foundation::KernelConfig config = {}, IRenderer* renderer = nullptr);
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /// Run one frame with @p rawDeltaMs of wall-clock time.
    FrameResult tick(double rawDeltaMs);

    /// Delta actually fed to the fixed-step scheduler for @p rawDeltaMs.
    ///
    /// Negative or non-finite deltas become 0.  A delta above
    /// max_frame_delta_ms (the process was suspended) becomes one fixed
    /// step.  Anything else is capped at max_steps_per_frame steps.
    [[nodiscard]] double clampDelta(double rawDeltaMs) const noexcept;

    // ── Scenes ──────────────────────────────────────────────────────

    /// Replace the active scene.
    ///
    /// The previous scene's destroy() runs at once and its actors are
    /// marked for destruction.  @p scene is initialized at once; its assets
    /// are loaded when the task queue is next drained, then awake() runs.
    /// If loading fails the scene stays in SceneState::Failed.
    foundation::KernelResult<void> loadScene(std::unique_ptr<Scene> scene);

    /// Active scene, or nullptr.
    [[nodiscard]] Scene* activeScene() const noexcept { return scene_.get(); }

    /// Shorthand for scenes().CreateActor().
    foundation::KernelResult<scene::Actor*> createActor(std::string name,
                                                        scene::Actor* parent = nullptr,
                                                        scene::ActorOptions options = {});

    // ── Services ────────────────────────────────────────────────────

    [[nodiscard]] foundation::TaskQueue& tasks() noexcept { return tasks_; }
    [[nodiscard]] asset::AssetManager& assets() noexcept { return assets_; }
    [[nodiscard]] scene::SceneManager& scenes() noexcept { return scenes_; }
    [[nodiscard]] const scene::SceneManager& scenes() const noexcept { return scenes_; }
    [[nodiscard]] FixedTimeStep& timeStep() noexcept { return timeStep_; }
    [[nodiscard]] const foundation::KernelConfig& config() const noexcept { return config_; }

    void setRenderer(IRenderer* renderer) noexcept { renderer_ = renderer; }
    [[nodiscard]] IRenderer* renderer() const noexcept { return renderer_; }

    /// Frames run so far.
    [[nodiscard]] uint64_t frameCount() const noexcept { return frame_; }

private:
    void finishSceneLoad(Scene* target);
    bool isActive(const Scene* scene) const noexcept {
        return scene_ && scene_.get() == scene && scene->state_ == SceneState::Running;
    }

    foundation::KernelConfig config_;
    foundation::TaskQueue tasks_;
    asset::AssetManager assets_;
    scene::SceneManager scenes_;
    FixedTimeStep timeStep_;
    IRenderer* renderer_;

    std::unique_ptr<Scene> scene_;

    // Replaced scenes, kept until their actors have been reaped.
    std::vector<std::unique_ptr<Scene>> retired_;

    uint64_t frame_ = 0;
};

} // namespace ark::runtime
