#include "ark/runtime/world.hpp"

#include "ark/foundation/kernel_logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ark::runtime {

using foundation::ErrorCode;
using foundation::KernelError;
using foundation::KernelResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

asset::AssetLoaderContext makeLoaderContext(const foundation::KernelConfig& config) {
    asset::AssetLoaderContext context;
    context.rootDirectory = config.assetsRoot;
    return context;
}

} // namespace

World::World(foundation::KernelConfig config, IRenderer* renderer)
    : config_(std::move(config)),
      assets_(tasks_, makeLoaderContext(config_)),
      timeStep_(FixedTimeStep::fromFramesPerSecond(config_.fixedFps)),
      renderer_(renderer) {
    assets_.setAutoload(config_.assetsAutoload);
}

World::~World() = default;

// ── Frame ────────────────────────────────────────────────────────────

double World::clampDelta(double rawDeltaMs) const noexcept {
    if (!std::isfinite(rawDeltaMs) || rawDeltaMs <= 0.0) {
        return 0.0;
    }
    const double step = timeStep_.stepMs();
    if (rawDeltaMs > config_.maxFrameDeltaMs) {
        return step;
    }
    return std::min(rawDeltaMs, step * config_.maxStepsPerFrame);
}

FrameResult World::tick(double rawDeltaMs) {
    FrameResult result;
    result.frame = frame_++;

    tasks_.drain();

    const double delta = clampDelta(rawDeltaMs);

    if (scene_ && scene_->state_ == SceneState::Awake) {
        scene_->state_ = SceneState::Running;
        scene_->start();
    }

    scenes_.FlushStarts();

    Scene* active = scene_.get();
    auto steps = timeStep_.tick(delta, [this, active](double stepMs) {
        if (isActive(active)) {
            active->fixedUpdate(stepMs);
        }
        scenes_.FixedUpdate(stepMs);
    });

    if (isActive(active)) {
        active->update(delta);
    }
    scenes_.Update(delta);

    scenes_.Reap();
    retired_.clear();

    result.updates = steps.updates;
    result.timeLeft = steps.timeLeft;
    result.interpolation = timeStep_.interpolation();

    if (result.updates > 0 && renderer_ != nullptr) {
        FrameContext context;
        context.frame = result.frame;
        context.deltaMs = delta;
        context.updates = result.updates;
        context.interpolation = result.interpolation;
        context.scenes = &scenes_;
        renderer_->draw(context);
        result.rendered = true;
    }
    return result;
}

// ── Scenes ───────────────────────────────────────────────────────────

KernelResult<void> World::loadScene(std::unique_ptr<Scene> scene) {
    if (!scene) {
        return KernelResult<void>::err(
            KernelError(ErrorCode::InvalidArgument, "loadScene requires a scene"));
    }

    if (scene_) {
        ARK_LOG_INFO(LogCategory::Runtime, "unloading scene " + scene_->name());
        scene_->destroy();
        scene_->state_ = SceneState::Destroyed;
        scenes_.DestroyAllActors();
        retired_.push_back(std::move(scene_));
    }

    scene_ = std::move(scene);
    scene_->world_ = this;
    scene_->state_ = SceneState::Loading;
    ARK_LOG_INFO(LogCategory::Runtime, "loading scene " + scene_->name());

    // Requests made by initialize() are flushed by the load task below,
    // so that a failure is attributed to this scene.
    const bool autoload = assets_.autoload();
    assets_.setAutoload(false);
    scene_->initialize(assets_);
    assets_.setAutoload(autoload);

    Scene* target = scene_.get();
    tasks_.post([this, target]() { finishSceneLoad(target); });
    return KernelResult<void>::ok();
}

void World::finishSceneLoad(Scene* target) {
    if (scene_.get() != target || target->state_ != SceneState::Loading) {
        return;  // replaced before its assets were loaded
    }

    auto flushed = assets_.flush();
    if (!flushed) {
        target->state_ = SceneState::Failed;
        LogContext ctx;
        ctx.frame = frame_;
        ctx.extra["scene"] = target->name();
        ctx.extra["error"] = flushed.error().toString();
        ARK_LOG_CTX(LogLevel::Error, LogCategory::Runtime, "scene failed to load", ctx);
        return;
    }

    target->awake();
    if (scene_.get() == target) {
        target->state_ = SceneState::Awake;
        ARK_LOG_INFO(LogCategory::Runtime, "scene " + target->name() + " awake");
    }
}

KernelResult<scene::Actor*> World::createActor(std::string name, scene::Actor* parent,
                                               scene::ActorOptions options) {
    return scenes_.CreateActor(std::move(name), parent, std::move(options));
}

} // namespace ark::runtime
