#pragma once

/// @file scene.hpp
/// @brief Scene base class driven by runtime::World.

#include <string>
#include <string_view>
#include <utility>

namespace ark::asset {
class AssetManager;
}

namespace ark::runtime {

class World;

/// Where a scene is in its lifecycle.
///
/// Created -> Loading -> Awake -> Running -> Destroyed, or
/// Loading -> Failed when its assets could not be loaded.
enum class SceneState {
    Created,
    Loading,
    Awake,
    Running,
    Destroyed,
    Failed,
};

[[nodiscard]] constexpr std::string_view sceneStateName(SceneState state) noexcept {
    switch (state) {
        case SceneState::Created:   return "created";
        case SceneState::Loading:   return "loading";
        case SceneState::Awake:     return "awake";
        case SceneState::Running:   return "running";
        case SceneState::Destroyed: return "destroyed";
        case SceneState::Failed:    return "failed";
    }
    return "unknown";
}

/// A unit of content loaded into a World.
///
/// World::loadScene() calls initialize() at once; assets requested there
/// are loaded on the next frame, then awake() populates the actors.
/// start() runs at the beginning of the frame after that, and
/// update()/fixedUpdate() run every frame before the actors.  destroy()
/// runs when the scene is replaced; its actors are reaped afterwards.
///
/// Example:
/// @code
///   class Level : public Scene {
///   public:
///       Level() : Scene("level") {}
///       void initialize(asset::AssetManager& assets) override {
///           map_ = assets.request<std::string>("maps/one.txt");
///       }
///       void awake() override {
///           world().createActor("player");
///       }
///   private:
///       asset::LazyAsset<std::string> map_;
///   };
/// @endcode
class Scene {
public:
    explicit Scene(std::string name) : name_(std::move(name)) {}
    virtual ~Scene() = default;

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    /// Request the assets the scene needs.
    virtual void initialize(asset::AssetManager& /*assets*/) {}

    /// Create actors; every asset requested in initialize() is loaded.
    virtual void awake() {}

    /// First frame after awake().
    virtual void start() {}

    virtual void update(double /*deltaMs*/) {}
    virtual void fixedUpdate(double /*stepMs*/) {}

    /// The scene is being replaced.  Actors are destroyed by the World.
    virtual void destroy() {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] SceneState state() const noexcept { return state_; }

    /// World the scene is loaded into.  Valid from initialize() on.
    [[nodiscard]] World& world() const noexcept { return *world_; }

private:
    friend class World;

    std::string name_;
    SceneState state_ = SceneState::Created;
    World* world_ = nullptr;
};

} // namespace ark::runtime
