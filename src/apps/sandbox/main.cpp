/// @file main.cpp
/// @brief Sandbox entry point.
///
/// Runs a small demo scene for a fixed number of frames: a text asset is
/// loaded before the scene awakes, a few spinning actors are driven by
/// fixed steps, and one of them is destroyed halfway through.
///
/// Usage: ark_sandbox [--config <kernel.yaml>] [--frames <n>]

#include <any>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "ark/ark.hpp"

namespace {

using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

constexpr uint64_t kDefaultFrames = 240;

// ── Console logger ──────────────────────────────────────────────────

std::string_view levelTag(log_level level) {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO ";
        case log_level::warning:  return "WARN ";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRIT ";
        default:                  return "     ";
    }
}

class ConsoleLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        if (is_enabled(level)) {
            std::lock_guard lock(mutex_);
            std::clog << levelTag(level) << ' ' << message << '\n';
        }
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override { return level >= level_; }

    kcenon::common::VoidResult set_level(log_level level) override {
        level_ = level;
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return level_; }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        std::clog.flush();
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    std::mutex mutex_;
    log_level level_ = log_level::trace;
};

// ── Loaders ─────────────────────────────────────────────────────────

ark::foundation::KernelResult<std::any> loadText(const ark::asset::Asset& asset,
                                                 ark::asset::AssetLoaderContext& context,
                                                 const std::any& /*options*/) {
    using ark::foundation::ErrorCode;
    using ark::foundation::KernelError;
    using Result = ark::foundation::KernelResult<std::any>;

    const auto path = context.rootDirectory / asset.key();
    std::ifstream in(path);
    if (!in) {
        return Result::err(KernelError(ErrorCode::AssetLoadFailed,
                                       "cannot open " + path.string()));
    }
    std::ostringstream text;
    text << in.rdbuf();
    return Result::ok(std::any(text.str()));
}

// ── Demo behaviors ──────────────────────────────────────────────────

class Spinner : public ark::scene::Behavior {
public:
    explicit Spinner(ark::scene::Actor& actor)
        : Behavior(actor, "Spinner",
                   ark::scene::kBehaviorCapabilities | ark::scene::Capability::FixedUpdate) {
        DeclareProperty("degreesPerSecond", ark::scene::PropertyType::Number);
        DeclareProperty("angle", ark::scene::PropertyType::Number);
    }

    void OnFixedUpdate(double stepMs) override {
        const double speed = GetProperty("degreesPerSecond", 90.0);
        double angle = GetProperty("angle", 0.0) + speed * stepMs / 1000.0;
        while (angle >= 360.0) {
            angle -= 360.0;
        }
        SetProperty("angle", angle);
    }

    void OnDestroy() override {
        ARK_LOG_INFO(ark::foundation::LogCategory::Behavior,
                     GetActor().Name() + " stopped at " +
                         std::to_string(GetProperty("angle", 0.0)) + " degrees");
    }
};

class Greeter : public ark::scene::Component {
public:
    Greeter(ark::scene::Actor& actor, ark::asset::LazyAsset<std::string> text)
        : Component(actor, "Greeter", ark::scene::Capability::Start),
          text_(std::move(text)) {}

    void OnStart() override {
        auto text = text_.get();
        if (text) {
            ARK_LOG_INFO(ark::foundation::LogCategory::Core, "greeting: " + text.value());
        } else {
            ARK_LOG_WARN(ark::foundation::LogCategory::Core,
                         std::string(text.error().message()));
        }
    }

private:
    ark::asset::LazyAsset<std::string> text_;
};

// ── Demo scene ──────────────────────────────────────────────────────

class DemoScene : public ark::runtime::Scene {
public:
    explicit DemoScene(uint64_t frames) : Scene("demo"), frames_(frames) {}

    void initialize(ark::asset::AssetManager& assets) override {
        greeting_ = assets.request<std::string>("greeting.txt");
    }

    void awake() override {
        auto root = world().createActor("world");
        if (!root) {
            return;
        }
        if (greeting_) {
            root.value()->AddComponent<Greeter>(*greeting_);
        }

        for (int i = 1; i <= 3; ++i) {
            auto spinner = world().createActor("spinner-" + std::to_string(i), root.value());
            if (spinner) {
                spinner.value()->AddComponentWith<Spinner>([i](Spinner& s) {
                    s.SetProperty("degreesPerSecond", 45.0 * i);
                });
            }
        }
    }

    void update(double /*deltaMs*/) override {
        if (++frame_ != frames_ / 2) {
            return;
        }
        if (auto* victim = world().scenes().GetActor("world/spinner-2")) {
            world().scenes().Tree().DestroyActor(*victim);
        }
    }

private:
    uint64_t frames_;
    uint64_t frame_ = 0;
    std::optional<ark::asset::LazyAsset<std::string>> greeting_;
};

class CountingRenderer : public ark::runtime::IRenderer {
public:
    void draw(const ark::runtime::FrameContext& frame) override {
        ++draws_;
        if (report_.walk()) {
            std::size_t spinners = frame.scenes->Tree().GetActors("world/spinner-*").Count();
            ARK_LOG_INFO(ark::foundation::LogCategory::Runtime,
                         "frame " + std::to_string(frame.frame) + ": " +
                             std::to_string(spinners) + " spinner(s), alpha " +
                             std::to_string(frame.interpolation));
        }
    }

    [[nodiscard]] uint64_t draws() const noexcept { return draws_; }

private:
    uint64_t draws_ = 0;
    ark::runtime::Timer report_{60};
};

// ── CLI ─────────────────────────────────────────────────────────────

std::string_view findArg(int argc, char* argv[], std::string_view name) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == name) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace

int main(int argc, char* argv[]) {
    GlobalLoggerRegistry::instance().set_default_logger(std::make_shared<ConsoleLogger>());

    std::filesystem::path configPath(findArg(argc, argv, "--config"));
    if (const char* envPath = std::getenv("ARK_CONFIG_PATH"); envPath != nullptr) {
        configPath = envPath;
    }

    ark::foundation::ConfigManager config;
    if (!configPath.empty()) {
        auto loadResult = config.load(configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().toString() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto kernelConfig = ark::foundation::loadKernelConfig(config);
    if (!kernelConfig) {
        std::cerr << "Invalid kernel config: " << kernelConfig.error().toString() << "\n";
        return EXIT_FAILURE;
    }
    ark::foundation::applyLogLevels(kernelConfig.value(), ark::foundation::KernelLogger::instance());

    uint64_t frames = kDefaultFrames;
    if (auto arg = findArg(argc, argv, "--frames"); !arg.empty()) {
        frames = std::strtoull(std::string(arg).c_str(), nullptr, 10);
    }

    CountingRenderer renderer;
    ark::runtime::World world(kernelConfig.value(), &renderer);
    world.assets().registry().registerLoader("text", {".txt", ".md"}, loadText);

    auto loaded = world.loadScene(std::make_unique<DemoScene>(frames));
    if (!loaded) {
        std::cerr << "Failed to load scene: " << loaded.error().toString() << "\n";
        return EXIT_FAILURE;
    }

    ark::runtime::FrameLoop loop(world);
    auto ran = loop.runFrames(frames);
    if (!ran) {
        std::cerr << "Frame loop failed: " << ran.error().toString() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Ran " << ran.value() << " frame(s), drew " << renderer.draws()
              << ", scene " << ark::runtime::sceneStateName(world.activeScene()->state())
              << ", " << world.scenes().ActorCount() << " actor(s) alive\n";

    auto flushed = ark::foundation::KernelLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().toString() << "\n";
    }
    return world.activeScene()->state() == ark::runtime::SceneState::Failed ? EXIT_FAILURE
                                                                           : EXIT_SUCCESS;
}
